#pragma once
#include <string>
#include <variant>

namespace weathermcp::tools
{

enum class ErrorKind
{
    InvalidInput,
    Network,
    HttpStatus,
    Decode,
    MissingField
};

const char* to_string(ErrorKind kind);

/// Failure of a tool step. `detail` keeps the cause for logs and tests;
/// `message` is what the caller of the tool gets to see.
struct ToolError
{
    ErrorKind kind;
    std::string detail;
    std::string message;
};

using Outcome = std::variant<std::string, ToolError>;

inline bool is_ok(const Outcome& o)
{
    return std::holds_alternative<std::string>(o);
}

/// Collapses an outcome to the user-facing text; errors are logged with their detail.
std::string present(const std::string& tool_name, const Outcome& outcome);

} // namespace weathermcp::tools
