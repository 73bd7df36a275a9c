#pragma once
/// @file client/client.hpp
/// @brief MCP client session: handshake, tool discovery and tool calls

#include "weathermcp/client/transports.hpp"
#include "weathermcp/client/types.hpp"
#include "weathermcp/exceptions.hpp"
#include "weathermcp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp::client
{

/// One MCP session over a transport.
///
/// Example usage:
/// @code
/// Client client(std::make_unique<StdioTransport>("./weathermcp_server"));
/// client.initialize();
/// for (const auto& tool : client.list_tools())
///     std::cout << tool.name << std::endl;
/// auto result = client.call_tool("get_alerts", {{"state", "CA"}});
/// std::cout << result.text() << std::endl;
/// @endcode
///
/// Calls are strictly sequential; a Client is not meant to be shared between
/// threads.
class Client
{
  public:
    Client() = default;
    explicit Client(std::unique_ptr<ITransport> t) : transport_(std::move(t)) {}

    void set_transport(std::unique_ptr<ITransport> t)
    {
        transport_ = std::move(t);
        session_.reset();
    }

    bool has_transport() const
    {
        return transport_ != nullptr;
    }

    /// Raw request; returns the JSON-RPC result member
    weathermcp::Json call(const std::string& method, const weathermcp::Json& params)
    {
        if (!transport_)
            throw weathermcp::TransportError("Client has no transport");
        return transport_->request(method, params);
    }

    // ==========================================================================
    // Session Operations
    // ==========================================================================

    /// Handshake: initialize request followed by notifications/initialized.
    const InitializeResult& initialize(const std::string& client_name = "weathermcp-client",
                                       const std::string& client_version = "1.0.0");

    /// Negotiated session state, set by initialize()
    const std::optional<InitializeResult>& session() const
    {
        return session_;
    }

    bool is_initialized() const
    {
        return session_.has_value();
    }

    /// Send a ping to check server connectivity
    bool ping();

    // ==========================================================================
    // Tool Operations
    // ==========================================================================

    std::vector<ToolInfo> list_tools();

    /// Call a tool and return its result
    /// @param raise_on_error Throw weathermcp::Error(first text block) if the
    ///                       server flags the result with isError
    CallToolResult call_tool(const std::string& name, const weathermcp::Json& arguments,
                             bool raise_on_error = true);

  private:
    static CallToolResult parse_call_tool_result(const weathermcp::Json& response);

    std::unique_ptr<ITransport> transport_;
    std::optional<InitializeResult> session_;
};

} // namespace weathermcp::client
