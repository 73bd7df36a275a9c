#include "weathermcp/mcp/handler.hpp"

#include "weathermcp/exceptions.hpp"
#include "weathermcp/util/log.hpp"

namespace weathermcp::mcp
{

weathermcp::Json jsonrpc_error(const weathermcp::Json& id, int code, const std::string& message)
{
    return weathermcp::Json{{"jsonrpc", "2.0"},
                            {"id", id.is_null() ? weathermcp::Json() : id},
                            {"error", weathermcp::Json{{"code", code}, {"message", message}}}};
}

static weathermcp::Json jsonrpc_result(const weathermcp::Json& id, weathermcp::Json result)
{
    return weathermcp::Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

static weathermcp::Json make_tool_entry(const tools::Tool& tool)
{
    weathermcp::Json entry = {{"name", tool.name()}};
    if (tool.description())
        entry["description"] = *tool.description();
    const auto& schema = tool.input_schema();
    if (!schema.is_null() && !schema.empty())
        entry["inputSchema"] = schema;
    else
        entry["inputSchema"] = weathermcp::Json{{"type", "object"}};
    return entry;
}

static weathermcp::Json text_result(const std::string& text, bool is_error)
{
    return weathermcp::Json{
        {"content", weathermcp::Json::array({weathermcp::Json{{"type", "text"}, {"text", text}}})},
        {"isError", is_error}};
}

McpHandler make_mcp_handler(const std::string& server_name, const std::string& version,
                            const tools::ToolManager& tools,
                            std::optional<std::string> instructions)
{
    return [server_name, version, &tools,
            instructions](const weathermcp::Json& message) -> weathermcp::Json
    {
        const bool is_notification = message.is_object() && !message.contains("id");
        const auto id = message.is_object() && message.contains("id") ? message.at("id")
                                                                       : weathermcp::Json();
        try
        {
            if (!message.is_object() || !message.contains("method") ||
                !message["method"].is_string())
                return jsonrpc_error(id, error_code::InvalidRequest, "Invalid Request");

            std::string method = message["method"].get<std::string>();
            weathermcp::Json params = message.value("params", weathermcp::Json::object());

            if (is_notification)
            {
                log::debug("notification: " + method);
                return weathermcp::Json();
            }

            if (method == "initialize")
            {
                std::string requested = params.value("protocolVersion", "");
                std::string negotiated = weathermcp::is_known_protocol_version(requested)
                                             ? requested
                                             : std::string(weathermcp::PROTOCOL_VERSION);
                if (params.contains("clientInfo") && params["clientInfo"].is_object())
                    log::info("client connected: " +
                              params["clientInfo"].value("name", std::string("unknown")) +
                              " (protocol " + negotiated + ")");

                weathermcp::Json result = {
                    {"protocolVersion", negotiated},
                    {"capabilities",
                     weathermcp::Json{{"tools", weathermcp::Json{{"listChanged", false}}}}},
                    {"serverInfo", weathermcp::Json{{"name", server_name}, {"version", version}}},
                };
                if (instructions)
                    result["instructions"] = *instructions;
                return jsonrpc_result(id, std::move(result));
            }

            if (method == "ping")
                return jsonrpc_result(id, weathermcp::Json::object());

            if (method == "tools/list")
            {
                weathermcp::Json tools_array = weathermcp::Json::array();
                for (const auto& name : tools.list_names())
                    tools_array.push_back(make_tool_entry(tools.get(name)));
                return jsonrpc_result(id, weathermcp::Json{{"tools", tools_array}});
            }

            if (method == "tools/call")
            {
                std::string name = params.value("name", "");
                weathermcp::Json args = params.value("arguments", weathermcp::Json::object());
                if (name.empty())
                    return jsonrpc_error(id, error_code::InvalidParams, "Missing tool name");
                if (!tools.has(name))
                    return jsonrpc_error(id, error_code::InvalidParams, "Unknown tool: " + name);

                log::debug("tools/call " + name + " " + args.dump());
                try
                {
                    return jsonrpc_result(id, text_result(tools.invoke(name, args), false));
                }
                catch (const weathermcp::ValidationError& e)
                {
                    log::info("tools/call " + name + " rejected arguments: " + e.what());
                    return jsonrpc_result(
                        id, text_result(std::string("Invalid arguments for ") + name + ": " +
                                            e.what(),
                                        true));
                }
                catch (const std::exception& e)
                {
                    log::error("tools/call " + name + " failed: " + e.what());
                    return jsonrpc_result(
                        id, text_result(std::string("Error executing tool ") + name + ": " +
                                            e.what(),
                                        true));
                }
            }

            return jsonrpc_error(id, error_code::MethodNotFound,
                                 std::string("Method '") + method + "' not found");
        }
        catch (const std::exception& e)
        {
            if (is_notification)
            {
                log::warning(std::string("notification handling failed: ") + e.what());
                return weathermcp::Json();
            }
            return jsonrpc_error(id, error_code::InternalError, e.what());
        }
    };
}

} // namespace weathermcp::mcp
