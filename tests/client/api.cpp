#include "weathermcp/client/client.hpp"
#include "weathermcp/exceptions.hpp"
#include "weathermcp/mcp/handler.hpp"
#include "weathermcp/tools/manager.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using weathermcp::Json;
using namespace weathermcp::client;

int main()
{
    namespace tools = weathermcp::tools;

    tools::ToolManager tm;
    tm.register_tool(tools::Tool{"get_alerts",
                                 Json{{"type", "object"},
                                      {"properties", Json{{"state", Json{{"type", "string"}}}}},
                                      {"required", Json::array({"state"})}},
                                 [](const Json& args)
                                 {
                                     if (!args.contains("state"))
                                         throw weathermcp::ValidationError("state is required");
                                     return "alerts " + args["state"].get<std::string>();
                                 },
                                 "Get alerts"});
    auto handler = weathermcp::mcp::make_mcp_handler("weather", "1.0.0", tm,
                                                     std::string("Ask about the weather"));

    // Record every message the client sends
    std::vector<Json> seen;
    auto recording = [&](const Json& msg)
    {
        seen.push_back(msg);
        return handler(msg);
    };

    Client client(std::make_unique<InProcessTransport>(recording));
    assert(client.has_transport());
    assert(!client.is_initialized());

    // Handshake
    {
        const auto& init = client.initialize("api-test", "0.0.1");
        assert(client.is_initialized());
        assert(init.protocolVersion == weathermcp::PROTOCOL_VERSION);
        assert(init.serverInfo.name == "weather");
        assert(init.serverInfo.version == "1.0.0");
        assert(init.capabilities.tools.has_value());
        assert(init.instructions.has_value() && *init.instructions == "Ask about the weather");

        assert(seen.size() == 2);
        assert(seen[0]["method"] == "initialize");
        assert(seen[0]["params"]["clientInfo"]["name"] == "api-test");
        assert(seen[0]["params"]["protocolVersion"] == weathermcp::PROTOCOL_VERSION);
        assert(seen[1]["method"] == "notifications/initialized");
        assert(!seen[1].contains("id"));
        std::cout << "  [PASS] initialize + initialized notification" << std::endl;
    }

    assert(client.ping());

    // Discovery
    {
        auto list = client.list_tools();
        assert(list.size() == 1);
        assert(list[0].name == "get_alerts");
        assert(list[0].description.has_value() && *list[0].description == "Get alerts");
        assert(list[0].inputSchema["required"][0] == "state");
        std::cout << "  [PASS] list_tools" << std::endl;
    }

    // Successful call
    {
        auto result = client.call_tool("get_alerts", Json{{"state", "CA"}});
        assert(!result.isError);
        assert(result.content.size() == 1);
        assert(result.text() == "alerts CA");
        std::cout << "  [PASS] call_tool" << std::endl;
    }

    // isError results raise by default, or come back flagged
    {
        bool threw = false;
        try
        {
            client.call_tool("get_alerts", Json::object());
        }
        catch (const weathermcp::Error& e)
        {
            threw = true;
            assert(std::string(e.what()).find("state is required") != std::string::npos);
        }
        assert(threw);

        auto result = client.call_tool("get_alerts", Json::object(), false);
        assert(result.isError);
        assert(result.text().find("state is required") != std::string::npos);
        std::cout << "  [PASS] isError handling" << std::endl;
    }

    // Protocol errors surface as RpcError with the code
    {
        bool threw = false;
        try
        {
            client.call_tool("no_such_tool", Json::object());
        }
        catch (const weathermcp::RpcError& e)
        {
            threw = true;
            assert(e.code == weathermcp::mcp::error_code::InvalidParams);
        }
        assert(threw);

        threw = false;
        try
        {
            client.call("resources/list", Json::object());
        }
        catch (const weathermcp::RpcError& e)
        {
            threw = true;
            assert(e.code == weathermcp::mcp::error_code::MethodNotFound);
        }
        assert(threw);
        std::cout << "  [PASS] RpcError" << std::endl;
    }

    // Request ids increase
    {
        int last = 0;
        for (const auto& msg : seen)
        {
            if (!msg.contains("id"))
                continue;
            int id = msg["id"].get<int>();
            assert(id > last);
            last = id;
        }
    }

    // No transport
    {
        Client bare;
        bool threw = false;
        try
        {
            bare.list_tools();
        }
        catch (const weathermcp::TransportError&)
        {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "client api: all tests passed" << std::endl;
    return 0;
}
