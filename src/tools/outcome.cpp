#include "weathermcp/tools/outcome.hpp"

#include "weathermcp/util/log.hpp"

namespace weathermcp::tools
{

const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::InvalidInput:
        return "invalid_input";
    case ErrorKind::Network:
        return "network";
    case ErrorKind::HttpStatus:
        return "http_status";
    case ErrorKind::Decode:
        return "decode";
    case ErrorKind::MissingField:
        return "missing_field";
    }
    return "unknown";
}

std::string present(const std::string& tool_name, const Outcome& outcome)
{
    if (const auto* text = std::get_if<std::string>(&outcome))
        return *text;

    const auto& err = std::get<ToolError>(outcome);
    log::debug(tool_name + " failed (" + to_string(err.kind) + "): " + err.detail);
    return err.message;
}

} // namespace weathermcp::tools
