#include "mcpserve/tools/tool.hpp"

#include "mcpserve/schema/decode.hpp"

#include <unordered_set>

namespace mcpserve::tools
{

Tool::Tool(std::string name, std::string description, std::vector<ParameterSpec> parameters,
           ReturnSpec returns, Handler fn)
    : name_(std::move(name)), description_(std::move(description)),
      parameters_(std::move(parameters)), returns_(std::move(returns)), fn_(std::move(fn)),
      input_schema_(schema::input_schema(parameters_))
{
}

Json Tool::to_listing() const
{
    return Json{{"name", name_}, {"description", description_}, {"inputSchema", input_schema_}};
}

Arguments Tool::decode(const Json& arguments) const
{
    return Arguments(schema::decode_arguments(parameters_, arguments));
}

ToolResult Tool::invoke(const Arguments& args) const
{
    return fn_(args);
}

Tool Tool::renamed(std::string name) const
{
    Tool copy = *this;
    copy.name_ = std::move(name);
    return copy;
}

void Tool::validate() const
{
    if (name_.empty())
        throw ConfigurationError(name_, "tool name must not be empty");
    if (!fn_)
        throw ConfigurationError(name_, "tool '" + name_ + "' has no handler");

    std::unordered_set<std::string> seen;
    for (const auto& p : parameters_)
    {
        if (p.name.empty())
            throw ConfigurationError(name_, "tool '" + name_ + "' has an unnamed parameter");
        if (!seen.insert(p.name).second)
            throw ConfigurationError(name_, "tool '" + name_ + "' declares parameter '" + p.name +
                                                "' more than once");
        if (schema::contains_result(p.type))
            throw ConfigurationError(name_, "tool '" + name_ + "' parameter '" + p.name +
                                                "' uses a result wrapper type");
    }
}

} // namespace mcpserve::tools
