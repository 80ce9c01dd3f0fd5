#pragma once
#include "mcpserve/tools/tool.hpp"
#include "mcpserve/tools/typed.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mcpserve::tools
{

/// Separator between a toolset's namespace and an operation name
constexpr const char* NAMESPACE_SEPARATOR = "_";

/// "Calculator" -> "calculator", "HttpClient" -> "http_client"
std::string to_snake_case(const std::string& name);

/// namespace + "_" + operation; the operation name alone when namespace is empty
std::string exposed_name(const std::string& name_space, const std::string& operation);

/// A cohesive group of related tools registered together.
///
/// Every tool added is exposed as "<namespace>_<operation>", so several
/// toolsets can be registered side by side without name collisions.
///
/// Usage:
/// ```cpp
/// auto counter = std::make_shared<Counter>();
/// Toolset set("counter");
/// set.add("get", "Get the current count", {}, counter, &Counter::get);
/// set.add("increment", "Increment the counter", {{"by", "Amount"}}, counter,
///         &Counter::increment);
/// registry.register_toolset(set);   // counter_get, counter_increment
/// ```
class Toolset
{
  public:
    explicit Toolset(std::string name_space);

    const std::string& name_space() const
    {
        return name_space_;
    }
    const std::vector<Tool>& tools() const
    {
        return tools_;
    }
    std::size_t size() const
    {
        return tools_.size();
    }

    /// Add a tool whose name() is the bare operation name.
    Toolset& add(const Tool& tool);

    template <typename Fn>
    Toolset& add(std::string operation, std::string description, std::vector<ParamDoc> params,
                 Fn fn)
    {
        return add(make_tool(std::move(operation), std::move(description), std::move(params),
                             std::move(fn)));
    }

    template <typename Owner, typename Method>
    Toolset& add(std::string operation, std::string description, std::vector<ParamDoc> params,
                 std::shared_ptr<Owner> owner, Method method)
    {
        return add(make_tool(std::move(operation), std::move(description), std::move(params),
                             std::move(owner), method));
    }

  private:
    std::string name_space_;
    std::vector<Tool> tools_;
};

} // namespace mcpserve::tools
