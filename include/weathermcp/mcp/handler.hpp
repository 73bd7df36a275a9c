#pragma once
#include "weathermcp/tools/manager.hpp"
#include "weathermcp/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace weathermcp::mcp
{

/// JSON-RPC message in, JSON-RPC response out. A null return means the message
/// was a notification and nothing must be written back.
using McpHandler = std::function<weathermcp::Json(const weathermcp::Json&)>;

/// JSON-RPC error codes used on the wire.
namespace error_code
{
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
} // namespace error_code

weathermcp::Json jsonrpc_error(const weathermcp::Json& id, int code, const std::string& message);

// Factory for the server side of a tools-only MCP session. Supported methods:
// - "initialize"
// - "notifications/*" (no reply)
// - "ping"
// - "tools/list"
// - "tools/call"
// The ToolManager is captured by reference and must outlive the handler.
McpHandler make_mcp_handler(const std::string& server_name, const std::string& version,
                            const tools::ToolManager& tools,
                            std::optional<std::string> instructions = std::nullopt);

} // namespace weathermcp::mcp
