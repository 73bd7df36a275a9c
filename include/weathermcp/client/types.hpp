#pragma once
/// @file client/types.hpp
/// @brief MCP result types returned by Client operations

#include "weathermcp/content.hpp"
#include "weathermcp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace weathermcp::client
{

// ============================================================================
// Tool Types
// ============================================================================

/// Tool information as returned by tools/list
struct ToolInfo
{
    std::string name;
    std::optional<std::string> description;
    weathermcp::Json inputSchema; ///< JSON Schema for tool input
};

/// Result of tools/call request
struct CallToolResult
{
    std::vector<weathermcp::TextContent> content;
    bool isError{false};

    /// Text of the first content block, empty when there is none
    std::string text() const
    {
        return content.empty() ? std::string() : content.front().text;
    }
};

// ============================================================================
// Session Types
// ============================================================================

struct ServerCapabilities
{
    std::optional<weathermcp::Json> logging;
    std::optional<weathermcp::Json> prompts;
    std::optional<weathermcp::Json> resources;
    std::optional<weathermcp::Json> tools;
};

struct ServerInfo
{
    std::string name;
    std::string version;
};

/// Result of initialize request; what the session negotiated
struct InitializeResult
{
    std::string protocolVersion;
    ServerCapabilities capabilities;
    ServerInfo serverInfo;
    std::optional<std::string> instructions;
};

// ============================================================================
// JSON Serialization Helpers
// ============================================================================

inline void to_json(weathermcp::Json& j, const ToolInfo& t)
{
    j = weathermcp::Json{{"name", t.name}, {"inputSchema", t.inputSchema}};
    if (t.description)
        j["description"] = *t.description;
}

inline void from_json(const weathermcp::Json& j, ToolInfo& t)
{
    t.name = j.at("name").get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        t.description = j["description"].get<std::string>();
    t.inputSchema = j.value("inputSchema", weathermcp::Json::object());
}

inline void from_json(const weathermcp::Json& j, InitializeResult& r)
{
    r.protocolVersion = j.value("protocolVersion", std::string(weathermcp::PROTOCOL_VERSION));
    if (j.contains("capabilities") && j["capabilities"].is_object())
    {
        const auto& caps = j["capabilities"];
        if (caps.contains("logging"))
            r.capabilities.logging = caps["logging"];
        if (caps.contains("prompts"))
            r.capabilities.prompts = caps["prompts"];
        if (caps.contains("resources"))
            r.capabilities.resources = caps["resources"];
        if (caps.contains("tools"))
            r.capabilities.tools = caps["tools"];
    }
    if (j.contains("serverInfo") && j["serverInfo"].is_object())
    {
        r.serverInfo.name = j["serverInfo"].value("name", std::string("unknown"));
        r.serverInfo.version = j["serverInfo"].value("version", std::string("unknown"));
    }
    if (j.contains("instructions") && j["instructions"].is_string())
        r.instructions = j["instructions"].get<std::string>();
}

} // namespace weathermcp::client
