#pragma once
#include "weathermcp/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace weathermcp::tools
{

class Tool
{
  public:
    /// Maps decoded arguments to the tool's text. Throws ValidationError on bad arguments.
    using Fn = std::function<std::string(const weathermcp::Json&)>;

    Tool() = default;

    Tool(std::string name, weathermcp::Json input_schema, Fn fn,
         std::optional<std::string> description = std::nullopt)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::optional<std::string>& description() const
    {
        return description_;
    }
    const weathermcp::Json& input_schema() const
    {
        return input_schema_;
    }
    std::string invoke(const weathermcp::Json& input) const
    {
        return fn_(input);
    }

  private:
    std::string name_;
    std::optional<std::string> description_;
    weathermcp::Json input_schema_;
    Fn fn_;
};

} // namespace weathermcp::tools
