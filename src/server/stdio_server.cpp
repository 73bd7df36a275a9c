#include "weathermcp/server/stdio_server.hpp"

#include "weathermcp/mcp/handler.hpp"
#include "weathermcp/util/json.hpp"
#include "weathermcp/util/log.hpp"

#include <iostream>
#include <string>

namespace weathermcp::server
{

StdioServerWrapper::StdioServerWrapper(McpHandler handler)
    : StdioServerWrapper(std::move(handler), std::cin, std::cout)
{
}

StdioServerWrapper::StdioServerWrapper(McpHandler handler, std::istream& in, std::ostream& out)
    : handler_(std::move(handler)), in_(in), out_(out)
{
}

StdioServerWrapper::~StdioServerWrapper()
{
    stop();
}

void StdioServerWrapper::write_line(const weathermcp::Json& message)
{
    out_ << message.dump() << "\n";
    out_.flush();
}

void StdioServerWrapper::run_loop()
{
    std::string line;

    while (!stop_requested_ && std::getline(in_, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        ++handled_;

        weathermcp::Json request;
        try
        {
            request = weathermcp::util::json::parse(line);
        }
        catch (const weathermcp::Json::parse_error& e)
        {
            log::warning(std::string("unparsable message: ") + e.what());
            write_line(mcp::jsonrpc_error(weathermcp::Json(), mcp::error_code::ParseError,
                                          "Parse error"));
            continue;
        }

        weathermcp::Json response;
        try
        {
            response = handler_(request);
        }
        catch (const std::exception& e)
        {
            // Handlers report their own errors; this only covers a throwing custom handler
            if (!request.is_object() || !request.contains("id"))
                continue;
            response = mcp::jsonrpc_error(request["id"], mcp::error_code::InternalError, e.what());
        }

        if (response.is_null())
            continue;
        write_line(response);
    }

    log::debug("stdio server loop finished after " + std::to_string(handled_.load()) +
               " messages");
    running_ = false;
}

bool StdioServerWrapper::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    run_loop();

    return true;
}

bool StdioServerWrapper::start_async()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;

    thread_ = std::thread([this]() { run_loop(); });

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;

    if (thread_.joinable())
        thread_.join();

    running_ = false;
}

} // namespace weathermcp::server
