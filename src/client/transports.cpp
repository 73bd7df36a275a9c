#include "weathermcp/client/transports.hpp"

#include "../internal/process.hpp"
#include "weathermcp/util/json.hpp"
#include "weathermcp/util/log.hpp"

#include <chrono>

namespace weathermcp::client
{

weathermcp::Json unwrap_response(const weathermcp::Json& response)
{
    if (!response.is_object())
        throw weathermcp::TransportError("Malformed JSON-RPC response: " + response.dump());
    if (response.contains("error"))
    {
        const auto& err = response["error"];
        int code = err.is_object() ? err.value("code", 0) : 0;
        std::string message =
            err.is_object() ? err.value("message", std::string("Unknown error")) : err.dump();
        throw weathermcp::RpcError(code, message);
    }
    return response.value("result", weathermcp::Json::object());
}

// =============================================================================
// InProcessTransport
// =============================================================================

weathermcp::Json InProcessTransport::request(const std::string& method,
                                             const weathermcp::Json& params)
{
    weathermcp::Json message = {
        {"jsonrpc", "2.0"}, {"id", ++next_id_}, {"method", method}, {"params", params}};
    return unwrap_response(handler_(message));
}

void InProcessTransport::notify(const std::string& method, const weathermcp::Json& params)
{
    handler_(weathermcp::Json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}});
}

// =============================================================================
// StdioTransport
// =============================================================================

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args,
                               StdioOptions options)
    : command_(std::move(command)), args_(std::move(args)), options_(std::move(options))
{
}

StdioTransport::~StdioTransport()
{
    close();
}

void StdioTransport::connect()
{
    if (process_)
        return;

    process::ProcessOptions popts;
    popts.stderr_file = options_.stderr_file;

    auto proc = std::make_unique<process::Process>();
    try
    {
        proc->spawn(command_, args_, popts);
    }
    catch (const process::ProcessError& e)
    {
        throw weathermcp::TransportError(std::string("Failed to start MCP server: ") + e.what());
    }
    log::debug("spawned '" + command_ + "' pid " + std::to_string(proc->pid()));
    process_ = std::move(proc);
}

bool StdioTransport::is_connected() const
{
    return process_ != nullptr;
}

std::optional<int> StdioTransport::close()
{
    if (!process_)
        return std::nullopt;

    int code = process_->shutdown(static_cast<int>(options_.shutdown_grace.count()));
    log::debug("server '" + command_ + "' exited with code " + std::to_string(code));
    process_.reset();
    return code;
}

weathermcp::TransportError StdioTransport::failure(const std::string& what)
{
    std::string message = "StdioTransport: " + what;
    if (process_)
    {
        if (auto code = process_->try_wait())
            message += " (server exit code " + std::to_string(*code) + ")";
    }
    return weathermcp::TransportError(message);
}

void StdioTransport::send_line(const weathermcp::Json& message)
{
    connect();
    try
    {
        process_->stdin_pipe().write(message.dump() + "\n");
    }
    catch (const process::ProcessError& e)
    {
        throw failure(e.what());
    }
}

weathermcp::Json StdioTransport::read_response(int id)
{
    using clock = std::chrono::steady_clock;
    const bool bounded = options_.request_timeout.count() > 0;
    const auto deadline = clock::now() + options_.request_timeout;

    auto& out = process_->stdout_pipe();
    for (;;)
    {
        try
        {
            // A partial line must not hold us past the deadline
            while (bounded && !out.has_line())
            {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                                  clock::now());
                if (left.count() <= 0 || !out.has_data(static_cast<int>(left.count())))
                    throw failure("timed out waiting for response to request " +
                                  std::to_string(id));
                if (!out.has_line())
                    out.fill();
            }

            auto line = out.read_line();
            if (!line)
                throw failure("server closed the stream");
            if (line->empty())
                continue;

            weathermcp::Json message;
            try
            {
                message = weathermcp::util::json::parse(*line);
            }
            catch (const weathermcp::Json::parse_error&)
            {
                log::debug("ignoring non-JSON line from server: " + *line);
                continue;
            }

            if (!message.is_object() || !message.contains("id"))
            {
                // Server-initiated notification
                log::debug("server message: " + message.dump());
                continue;
            }
            if (message["id"] != weathermcp::Json(id))
            {
                log::debug("dropping response for unknown id " + message["id"].dump());
                continue;
            }
            return message;
        }
        catch (const process::ProcessError& e)
        {
            throw failure(e.what());
        }
    }
}

weathermcp::Json StdioTransport::request(const std::string& method, const weathermcp::Json& params)
{
    const int id = ++next_id_;
    send_line(weathermcp::Json{
        {"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
    return unwrap_response(read_response(id));
}

void StdioTransport::notify(const std::string& method, const weathermcp::Json& params)
{
    send_line(weathermcp::Json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}});
}

} // namespace weathermcp::client
