#pragma once
#include "weathermcp/types.hpp"

#include <atomic>
#include <functional>
#include <iosfwd>
#include <thread>

namespace weathermcp::server
{

/**
 * STDIO-based MCP server wrapper for line-delimited JSON-RPC communication.
 *
 * Reads one JSON-RPC message per line from the input stream and writes one
 * response per line to the output stream. Notifications (messages without an
 * "id") get no reply. By default the streams are std::cin / std::cout, which is
 * how an MCP client talks to a server it spawned.
 *
 * Usage:
 *   auto handler = weathermcp::mcp::make_mcp_handler("weather", "1.0.0", tools);
 *   StdioServerWrapper server(handler);
 *   server.run();  // Blocking - runs until EOF or stop() is called
 */
class StdioServerWrapper
{
  public:
    using McpHandler = std::function<weathermcp::Json(const weathermcp::Json&)>;

    explicit StdioServerWrapper(McpHandler handler);

    /// Serve over arbitrary streams; both must outlive the wrapper.
    StdioServerWrapper(McpHandler handler, std::istream& in, std::ostream& out);

    ~StdioServerWrapper();

    /**
     * Start the server (blocking mode).
     *
     * Runs until EOF on the input stream or until stop() is called.
     *
     * @return false if the server was already running
     */
    bool run();

    /// Launches run() on a background thread.
    bool start_async();

    /**
     * Stop the server.
     *
     * The flag is checked between lines, so a reader blocked on input stays
     * blocked until the next line or EOF arrives. Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// Number of lines processed so far (requests and notifications)
    std::size_t handled() const
    {
        return handled_.load();
    }

  private:
    void run_loop();
    void write_line(const weathermcp::Json& message);

    McpHandler handler_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> handled_{0};
    std::thread thread_;
};

} // namespace weathermcp::server
