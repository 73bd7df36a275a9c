// End-to-end: the client spawns the canned stub server over stdio.

#include "weathermcp/client/client.hpp"
#include "weathermcp/client/repl.hpp"
#include "weathermcp/exceptions.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

using weathermcp::Json;
using namespace weathermcp::client;

static const std::string CANNED_ALERT = "Event: Canned Storm\n"
                                        "Area: Stub County\n"
                                        "Severity: Minor\n"
                                        "Description: canned alert text\n"
                                        "Instructions: none";

static void test_session()
{
    StdioOptions opts;
    opts.request_timeout = std::chrono::milliseconds(10000);
    auto transport = std::make_unique<StdioTransport>(WEATHERMCP_STUB_SERVER,
                                                      std::vector<std::string>{}, opts);
    StdioTransport* raw = transport.get();
    assert(!raw->is_connected());

    Client client(std::move(transport));
    const auto& init = client.initialize();
    assert(raw->is_connected());
    assert(init.serverInfo.name == "weather-stub");
    assert(init.instructions && *init.instructions == "Canned weather for tests");

    auto list = client.list_tools();
    assert(list.size() == 2);
    assert(list[0].name == "get_alerts");
    assert(list[1].name == "get_forecast");
    assert(list[1].inputSchema["required"].size() == 2);

    auto alerts = client.call_tool("get_alerts", Json{{"state", "CA"}});
    assert(!alerts.isError);
    assert(alerts.text() == CANNED_ALERT);

    auto forecast = client.call_tool("get_forecast", Json{{"latitude", 37.78}, {"longitude", -122.42}});
    assert(forecast.text() == "Tonight: Canned (50°F) Wind 5 mph @ 37.78,-122.42");

    auto invalid = client.call_tool("get_alerts", Json{{"state", 5}}, false);
    assert(invalid.isError);

    bool threw = false;
    try
    {
        client.call_tool("get_weather", Json::object());
    }
    catch (const weathermcp::RpcError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("get_weather") != std::string::npos);
    }
    assert(threw);

    // The server is still usable after errors
    assert(client.ping());

    auto code = raw->close();
    assert(code && *code == 0);
    assert(!raw->is_connected());
    assert(!raw->close());
    std::cout << "  [PASS] stdio session" << std::endl;
}

static void test_repl_over_stdio()
{
    auto transport = std::make_unique<StdioTransport>(WEATHERMCP_STUB_SERVER);
    Client client(std::move(transport));
    std::istringstream in("alerts CA\nforecast nope 1\nforecast 1 2 3\nquit\n");
    std::ostringstream out;
    Repl repl(client, in, out);
    repl.run();

    const std::string text = out.str();
    assert(text.find("Connected. Tools available: get_alerts, get_forecast") != std::string::npos);
    assert(text.find(CANNED_ALERT + "\n") != std::string::npos);
    assert(text.find("Error: ") != std::string::npos);
    assert(text.find(FORECAST_USAGE) != std::string::npos);
    assert(repl.calls_made() == 1);
    assert(repl.state() == ReplState::Closed);
    std::cout << "  [PASS] repl over stdio" << std::endl;
}

static void test_stderr_file()
{
    char path[] = "/tmp/weathermcp_stderr_XXXXXX";
    int fd = ::mkstemp(path);
    assert(fd >= 0);
    ::close(fd);

    StdioOptions opts;
    opts.stderr_file = std::string(path);
    {
        StdioTransport transport(WEATHERMCP_STUB_SERVER, {}, opts);
        auto result = transport.request("ping", Json::object());
        assert(result.is_object());
        auto code = transport.close();
        assert(code && *code == 0);
    }

    std::ifstream log(path);
    std::stringstream contents;
    contents << log.rdbuf();
    assert(contents.str().find("stub server: stdin closed") != std::string::npos);
    std::remove(path);
    std::cout << "  [PASS] server stderr to file" << std::endl;
}

int main()
{
    test_session();
    test_repl_over_stdio();
    test_stderr_file();
    std::cout << "stdio client: all tests passed" << std::endl;
    return 0;
}
