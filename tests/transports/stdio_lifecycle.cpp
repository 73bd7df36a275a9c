// Failure paths of StdioTransport: servers that exit, never start, or hang.

#include "weathermcp/client/client.hpp"
#include "weathermcp/exceptions.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using weathermcp::Json;
using namespace weathermcp::client;

template <typename F>
static std::string transport_error(F&& f)
{
    try
    {
        f();
    }
    catch (const weathermcp::TransportError& e)
    {
        return e.what();
    }
    return std::string();
}

int main()
{
    // Server exits before answering
    {
        StdioTransport transport("sh", {"-c", "exit 42"});
        auto err = transport_error([&] { transport.request("initialize", Json::object()); });
        assert(!err.empty());
        assert(err.find("StdioTransport") != std::string::npos);
        auto code = transport.close();
        assert(code && *code == 42);
        std::cout << "  [PASS] early exit" << std::endl;
    }

    // Command that does not exist
    {
        StdioTransport transport("/nonexistent/weathermcp_server_xyz");
        auto err = transport_error([&] { transport.connect(); });
        assert(err.find("Failed to start MCP server") != std::string::npos);
        assert(!transport.is_connected());
        assert(!transport.close());

        Client client(std::make_unique<StdioTransport>("/nonexistent/weathermcp_server_xyz"));
        assert(!transport_error([&] { client.initialize(); }).empty());
        assert(!client.is_initialized());
        std::cout << "  [PASS] missing command" << std::endl;
    }

    // Server that never answers
    {
        StdioOptions opts;
        opts.request_timeout = std::chrono::milliseconds(200);
        opts.shutdown_grace = std::chrono::milliseconds(100);
        StdioTransport transport("sleep", {"30"}, opts);

        auto start = std::chrono::steady_clock::now();
        auto err = transport_error([&] { transport.request("ping", Json::object()); });
        assert(err.find("timed out") != std::string::npos);

        assert(transport.close().has_value());
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(elapsed < std::chrono::seconds(10));
        std::cout << "  [PASS] request timeout" << std::endl;
    }

    // Server that writes half a line and stalls
    {
        StdioOptions opts;
        opts.request_timeout = std::chrono::milliseconds(300);
        opts.shutdown_grace = std::chrono::milliseconds(100);
        StdioTransport transport("sh", {"-c", "printf '{\"jsonrpc\":'; sleep 30"}, opts);

        auto start = std::chrono::steady_clock::now();
        auto err = transport_error([&] { transport.request("ping", Json::object()); });
        assert(err.find("timed out") != std::string::npos);
        assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
        transport.close();
        std::cout << "  [PASS] timeout on partial line" << std::endl;
    }

    // Clean shutdown of a well-behaved server
    {
        StdioTransport transport(WEATHERMCP_STUB_SERVER);
        transport.connect();
        assert(transport.is_connected());
        auto code = transport.close();
        assert(code && *code == 0);
        std::cout << "  [PASS] clean close" << std::endl;
    }

    std::cout << "stdio lifecycle: all tests passed" << std::endl;
    return 0;
}
