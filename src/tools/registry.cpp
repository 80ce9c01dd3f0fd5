#include "mcpserve/tools/registry.hpp"

#include "mcpserve/util/log.hpp"

#include <unordered_set>

namespace mcpserve::tools
{

void ToolRegistry::check_open(const std::string& name) const
{
    if (sealed_)
        throw ConfigurationError(name, "cannot register tool '" + name +
                                           "': registry is sealed after serving started");
}

void ToolRegistry::register_tool(const Tool& tool)
{
    check_open(tool.name());
    tool.validate();
    if (index_.count(tool.name()))
        throw ConfigurationError(tool.name(), "duplicate tool name '" + tool.name() + "'");

    index_.emplace(tool.name(), tools_.size());
    tools_.push_back(tool);
    util::log::debug("registered tool " + tool.name());
}

void ToolRegistry::register_toolset(const Toolset& set)
{
    // Validate the whole set first so a failure leaves the registry untouched
    std::unordered_set<std::string> incoming;
    for (const auto& tool : set.tools())
    {
        check_open(tool.name());
        tool.validate();
        if (index_.count(tool.name()) || !incoming.insert(tool.name()).second)
            throw ConfigurationError(tool.name(), "duplicate tool name '" + tool.name() +
                                                      "' in toolset '" + set.name_space() + "'");
    }
    for (const auto& tool : set.tools())
        register_tool(tool);
}

const Tool* ToolRegistry::find(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &tools_[it->second];
}

const Tool& ToolRegistry::get(const std::string& name) const
{
    const Tool* tool = find(name);
    if (!tool)
        throw NotFoundError("tool not found: " + name);
    return *tool;
}

Json ToolRegistry::list() const
{
    Json out = Json::array();
    for (const auto& tool : tools_)
        out.push_back(tool.to_listing());
    return out;
}

std::vector<std::string> ToolRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_)
        out.push_back(tool.name());
    return out;
}

} // namespace mcpserve::tools
