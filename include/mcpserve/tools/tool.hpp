#pragma once
#include "mcpserve/exceptions.hpp"
#include "mcpserve/outcome.hpp"
#include "mcpserve/schema/traits.hpp"
#include "mcpserve/schema/type_spec.hpp"
#include "mcpserve/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcpserve::tools
{

/// One declared tool parameter. Required unless its type is optional(...).
using ParameterSpec = schema::FieldSpec;

struct ReturnSpec
{
    schema::TypeSpec type{schema::any()};

    /// True when the handler reports failures through Outcome
    bool fallible() const
    {
        return type.kind == schema::TypeSpec::Kind::Result;
    }
};

/// Decoded, validated arguments of one tools/call request.
class Arguments
{
  public:
    Arguments() : values_(Json::object()) {}
    explicit Arguments(Json values) : values_(std::move(values)) {}

    bool has(const std::string& name) const
    {
        auto it = values_.find(name);
        return it != values_.end() && !it->is_null();
    }

    /// Throws NotFoundError for an undeclared name and DecodeError when the
    /// value cannot be converted to T.
    template <typename T>
    T get(const std::string& name) const
    {
        auto it = values_.find(name);
        if (it == values_.end())
            throw NotFoundError("no argument named '" + name + "'");
        try
        {
            return schema::Convert<T>::from(*it);
        }
        catch (const Json::exception& e)
        {
            throw DecodeError("arguments." + name, e.what());
        }
    }

    template <typename T>
    std::optional<T> get_optional(const std::string& name) const
    {
        if (!has(name))
            return std::nullopt;
        return get<T>(name);
    }

    const Json& json() const
    {
        return values_;
    }

  private:
    Json values_;
};

/// A registered tool: identity, documentation, declared signature and handler.
/// Immutable once constructed; the input schema is derived once up front.
class Tool
{
  public:
    using Handler = std::function<ToolResult(const Arguments&)>;

    Tool(std::string name, std::string description, std::vector<ParameterSpec> parameters,
         ReturnSpec returns, Handler fn);

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const std::vector<ParameterSpec>& parameters() const
    {
        return parameters_;
    }
    const ReturnSpec& returns() const
    {
        return returns_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }

    /// tools/list entry: {"name","description","inputSchema"}
    Json to_listing() const;

    /// Throws DecodeError when arguments do not match the parameters.
    Arguments decode(const Json& arguments) const;

    /// Runs the handler. Exceptions thrown by the handler propagate.
    ToolResult invoke(const Arguments& args) const;

    /// Copy of this tool exposed under another name
    Tool renamed(std::string name) const;

    /// Throws ConfigurationError for an empty name, duplicate parameter
    /// names, a result wrapper among the parameters, or a missing handler.
    void validate() const;

  private:
    std::string name_;
    std::string description_;
    std::vector<ParameterSpec> parameters_;
    ReturnSpec returns_;
    Handler fn_;
    Json input_schema_;
};

} // namespace mcpserve::tools
