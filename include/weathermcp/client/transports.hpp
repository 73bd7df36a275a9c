#pragma once
#include "weathermcp/exceptions.hpp"
#include "weathermcp/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp::process
{
class Process;
}

namespace weathermcp::client
{

/// Abstract transport interface for MCP communication
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Send a request and wait for its response
    /// @param method The MCP method (e.g., "tools/list", "tools/call")
    /// @param params The request params
    /// @return The "result" member of the response
    /// @throws RpcError when the peer answers with a JSON-RPC error
    /// @throws TransportError when the stream fails
    virtual weathermcp::Json request(const std::string& method, const weathermcp::Json& params) = 0;

    /// Fire-and-forget notification; no response is expected
    virtual void notify(const std::string& method, const weathermcp::Json& params) = 0;
};

/// Unwraps a JSON-RPC response: returns "result" or throws RpcError.
weathermcp::Json unwrap_response(const weathermcp::Json& response);

/// Transport that calls a JSON-RPC handler function in the same process.
/// Useful for tests and for embedding a server without a subprocess.
class InProcessTransport : public ITransport
{
  public:
    using HandlerFn = std::function<weathermcp::Json(const weathermcp::Json&)>;

    explicit InProcessTransport(HandlerFn handler) : handler_(std::move(handler)) {}

    weathermcp::Json request(const std::string& method, const weathermcp::Json& params) override;
    void notify(const std::string& method, const weathermcp::Json& params) override;

  private:
    HandlerFn handler_;
    int next_id_ = 0;
};

struct StdioOptions
{
    /// Maximum wait for one response; zero waits forever
    std::chrono::milliseconds request_timeout{0};
    /// Server stderr is appended here; inherited from the client when unset
    std::optional<std::string> stderr_file;
    /// Grace period for the server to exit after its stdin is closed
    std::chrono::milliseconds shutdown_grace{2000};
};

/// Launches an MCP stdio server as a subprocess and keeps it for the whole
/// session. Messages are newline-delimited JSON; responses are matched to
/// requests by id. The subprocess is closed and reaped by close() or the
/// destructor, whichever comes first.
class StdioTransport : public ITransport
{
  public:
    explicit StdioTransport(std::string command, std::vector<std::string> args = {},
                            StdioOptions options = {});
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Spawn the server now instead of on the first request.
    /// @throws TransportError if the command cannot be executed
    void connect();

    bool is_connected() const;

    /// Close the server's stdin and reap it. Returns its exit code, or
    /// std::nullopt if it was never started.
    std::optional<int> close();

    weathermcp::Json request(const std::string& method, const weathermcp::Json& params) override;
    void notify(const std::string& method, const weathermcp::Json& params) override;

  private:
    void send_line(const weathermcp::Json& message);
    weathermcp::Json read_response(int id);
    weathermcp::TransportError failure(const std::string& what);

    std::string command_;
    std::vector<std::string> args_;
    StdioOptions options_;
    std::unique_ptr<process::Process> process_;
    int next_id_ = 0;
};

} // namespace weathermcp::client
