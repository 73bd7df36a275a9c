#include "weathermcp/client/client.hpp"
#include "weathermcp/client/repl.hpp"
#include "weathermcp/client/transports.hpp"
#include "weathermcp/settings.hpp"
#include "weathermcp/util/log.hpp"

#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <vector>

namespace
{

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int)
{
    g_interrupted = 1;
}

/// SIGINT without SA_RESTART, so a blocked read on stdin returns and the
/// loop can unwind through the destructors that stop the server.
void install_interrupt_handler()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
}

int usage()
{
    std::cout << "Usage: weathermcp_client path/to/weathermcp_server [server-args...]\n";
    return 1;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace weathermcp;

    if (argc < 2)
        return usage();

    auto settings = Settings::from_env();
    log::set_level(log::level_from_string(settings.log_level));
    log::set_name("client");

    std::vector<std::string> server_args(argv + 2, argv + argc);

    client::StdioOptions options;
    options.request_timeout = std::chrono::milliseconds(settings.request_timeout_ms);
    options.stderr_file = settings.server_log_file;

    install_interrupt_handler();

    client::Client session(std::make_unique<client::StdioTransport>(argv[1], server_args, options));
    client::Repl repl(session, std::cin, std::cout);
    repl.set_interrupt_flag(&g_interrupted);

    try
    {
        repl.start();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: could not connect to '" << argv[1] << "': " << e.what() << "\n";
        return 1;
    }

    try
    {
        repl.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
