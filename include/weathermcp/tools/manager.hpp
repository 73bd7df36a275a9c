#pragma once
#include "weathermcp/exceptions.hpp"
#include "weathermcp/tools/tool.hpp"

#include <map>
#include <string>
#include <vector>

namespace weathermcp::tools
{

/// Name-keyed tool registry. Filled once at startup, then only read: the
/// protocol handler holds it by const reference while serving.
class ToolManager
{
  public:
    /// Throws ValidationError on an empty or duplicate name.
    void register_tool(Tool t);

    bool has(const std::string& name) const
    {
        return tools_.count(name) != 0;
    }

    /// Throws NotFoundError for an unknown name.
    const Tool& get(const std::string& name) const;

    std::string invoke(const std::string& name, const weathermcp::Json& input) const
    {
        return get(name).invoke(input);
    }

    /// Names in lexical order
    std::vector<std::string> list_names() const;

    std::size_t size() const
    {
        return tools_.size();
    }

  private:
    std::map<std::string, Tool> tools_;
};

} // namespace weathermcp::tools
