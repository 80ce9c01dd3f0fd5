#pragma once
#include "mcpserve/exceptions.hpp"
#include "mcpserve/tools/tool.hpp"
#include "mcpserve/tools/toolset.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace mcpserve::tools
{

/// Name -> Tool lookup for one server.
///
/// Populated during startup, then sealed before the first request is served.
/// A sealed registry is read-only and may be shared across threads without
/// locking.
class ToolRegistry
{
  public:
    /// Throws ConfigurationError if the tool is invalid, its name is already
    /// taken, or the registry is sealed.
    void register_tool(const Tool& tool);

    /// Registers every tool of the set or none of them.
    void register_toolset(const Toolset& set);

    /// nullptr when no tool has that name
    const Tool* find(const std::string& name) const;

    /// Throws NotFoundError
    const Tool& get(const std::string& name) const;

    bool contains(const std::string& name) const
    {
        return index_.count(name) != 0;
    }

    /// tools/list payload, in registration order
    Json list() const;

    std::vector<std::string> names() const;

    std::size_t size() const
    {
        return tools_.size();
    }

    void seal()
    {
        sealed_ = true;
    }
    bool sealed() const
    {
        return sealed_;
    }

  private:
    void check_open(const std::string& name) const;

    std::vector<Tool> tools_;
    std::unordered_map<std::string, std::size_t> index_;
    bool sealed_{false};
};

} // namespace mcpserve::tools
