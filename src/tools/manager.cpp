#include "weathermcp/tools/manager.hpp"

namespace weathermcp::tools
{

void ToolManager::register_tool(Tool t)
{
    if (t.name().empty())
        throw weathermcp::ValidationError("tool name must not be empty");
    if (has(t.name()))
        throw weathermcp::ValidationError("tool already registered: " + t.name());
    auto name = t.name();
    tools_.emplace(std::move(name), std::move(t));
}

const Tool& ToolManager::get(const std::string& name) const
{
    auto it = tools_.find(name);
    if (it == tools_.end())
        throw weathermcp::NotFoundError("Unknown tool: " + name);
    return it->second;
}

std::vector<std::string> ToolManager::list_names() const
{
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& kv : tools_)
        names.push_back(kv.first);
    return names;
}

} // namespace weathermcp::tools
