#include "weathermcp/client/client.hpp"

#include "weathermcp/util/log.hpp"

namespace weathermcp::client
{

const InitializeResult& Client::initialize(const std::string& client_name,
                                           const std::string& client_version)
{
    weathermcp::Json payload = {
        {"protocolVersion", weathermcp::PROTOCOL_VERSION},
        {"capabilities", weathermcp::Json::object()},
        {"clientInfo", {{"name", client_name}, {"version", client_version}}}};

    auto response = call("initialize", payload);
    session_ = response.get<InitializeResult>();
    if (session_->protocolVersion != weathermcp::PROTOCOL_VERSION)
        log::info("server negotiated protocol " + session_->protocolVersion);

    transport_->notify("notifications/initialized", weathermcp::Json::object());
    return *session_;
}

bool Client::ping()
{
    try
    {
        call("ping", weathermcp::Json::object());
        return true;
    }
    catch (const weathermcp::Error& e)
    {
        log::debug(std::string("ping failed: ") + e.what());
        return false;
    }
}

std::vector<ToolInfo> Client::list_tools()
{
    auto response = call("tools/list", weathermcp::Json::object());
    std::vector<ToolInfo> tools;
    if (response.contains("tools") && response["tools"].is_array())
        for (const auto& t : response["tools"])
            tools.push_back(t.get<ToolInfo>());
    return tools;
}

CallToolResult Client::call_tool(const std::string& name, const weathermcp::Json& arguments,
                                 bool raise_on_error)
{
    auto result =
        parse_call_tool_result(call("tools/call", {{"name", name}, {"arguments", arguments}}));

    if (result.isError && raise_on_error)
    {
        std::string message = result.text();
        throw weathermcp::Error(message.empty() ? "Tool call failed" : message);
    }
    return result;
}

CallToolResult Client::parse_call_tool_result(const weathermcp::Json& response)
{
    if (!response.contains("content") || !response["content"].is_array())
        throw weathermcp::ValidationError("tools/call response missing content");

    CallToolResult result;
    result.isError = response.value("isError", false);
    for (const auto& block : response["content"])
    {
        // Only text blocks are produced by the weather tools; others are skipped
        if (block.is_object() && block.value("type", "") == "text")
            result.content.push_back(block.get<weathermcp::TextContent>());
    }
    return result;
}

} // namespace weathermcp::client
