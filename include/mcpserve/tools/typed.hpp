#pragma once
#include "mcpserve/tools/tool.hpp"

#include <cstddef>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

namespace mcpserve::tools
{

/// Name and documentation of one positional handler parameter.
struct ParamDoc
{
    std::string name;
    std::string description;

    ParamDoc(const char* n) : name(n) {}
    ParamDoc(std::string n, std::string d = "") : name(std::move(n)), description(std::move(d)) {}
};

namespace detail
{

template <typename T>
struct function_traits : function_traits<decltype(&T::operator())>
{
};

template <typename R, typename... A>
struct function_traits<R(A...)>
{
    using result_type = R;
    using args_tuple = std::tuple<std::decay_t<A>...>;
    static constexpr std::size_t arity = sizeof...(A);
};

template <typename R, typename... A>
struct function_traits<R (*)(A...)> : function_traits<R(A...)>
{
};

template <typename C, typename R, typename... A>
struct function_traits<R (C::*)(A...)> : function_traits<R(A...)>
{
};

template <typename C, typename R, typename... A>
struct function_traits<R (C::*)(A...) const> : function_traits<R(A...)>
{
};

template <typename R>
struct is_outcome : std::false_type
{
};

template <typename T>
struct is_outcome<Outcome<T>> : std::true_type
{
};

template <typename Args, std::size_t... I>
std::vector<ParameterSpec> parameter_specs(const std::vector<ParamDoc>& docs,
                                           std::index_sequence<I...>)
{
    return {ParameterSpec{docs[I].name,
                          schema::TypeOf<std::tuple_element_t<I, Args>>::spec(),
                          docs[I].description}...};
}

template <typename R>
ReturnSpec return_spec()
{
    if constexpr (std::is_void_v<R>)
        return ReturnSpec{schema::any()};
    else
        return ReturnSpec{schema::TypeOf<R>::spec()};
}

template <typename R>
ToolResult encode_result(R&& value)
{
    using V = std::decay_t<R>;
    if constexpr (is_outcome<V>::value)
    {
        if (!value.ok())
            return value.failure();
        return schema::Convert<typename V::value_type>::to(value.value());
    }
    else
    {
        return schema::Convert<V>::to(value);
    }
}

template <typename Fn, typename Args, std::size_t... I>
ToolResult call_with(const Fn& fn, const Arguments& args, const std::vector<std::string>& names,
                     std::index_sequence<I...>)
{
    using R = typename function_traits<Fn>::result_type;
    if constexpr (std::is_void_v<R>)
    {
        fn(args.get<std::tuple_element_t<I, Args>>(names[I])...);
        return Json(nullptr);
    }
    else
    {
        return encode_result(fn(args.get<std::tuple_element_t<I, Args>>(names[I])...));
    }
}

} // namespace detail

/// Build a Tool from a callable, deriving the parameter schema, the decoder
/// and the result encoder from the callable's signature.
///
/// ```cpp
/// auto add = make_tool("add", "Add two numbers", {{"a", "First operand"}, "b"},
///                      [](int64_t a, int64_t b) { return a + b; });
/// ```
///
/// Return Outcome<T> to report failures; any other return type always succeeds.
/// Throws ConfigurationError when the number of ParamDocs does not match the
/// callable's arity.
template <typename Fn>
Tool make_tool(std::string name, std::string description, std::vector<ParamDoc> params, Fn fn)
{
    using traits = detail::function_traits<std::decay_t<Fn>>;
    using Args = typename traits::args_tuple;
    using R = typename traits::result_type;
    constexpr std::size_t N = traits::arity;

    if (params.size() != N)
        throw ConfigurationError(name, "tool '" + name + "' documents " +
                                           std::to_string(params.size()) +
                                           " parameters but its handler takes " +
                                           std::to_string(N));

    std::vector<std::string> names;
    names.reserve(N);
    for (const auto& p : params)
        names.push_back(p.name);

    auto specs = detail::parameter_specs<Args>(params, std::make_index_sequence<N>{});
    Tool::Handler handler = [fn = std::move(fn), names = std::move(names)](const Arguments& args)
    {
        return detail::call_with<std::decay_t<Fn>, Args>(fn, args, names,
                                                        std::make_index_sequence<N>{});
    };
    return Tool(std::move(name), std::move(description), std::move(specs), detail::return_spec<R>(),
                std::move(handler));
}

/// Bind a member function of a shared owner object. The owner stays alive as
/// long as the tool does; tools of one toolset may share it.
template <typename Owner, typename R, typename... A>
Tool make_tool(std::string name, std::string description, std::vector<ParamDoc> params,
               std::shared_ptr<Owner> owner, R (Owner::*method)(A...) const)
{
    return make_tool(std::move(name), std::move(description), std::move(params),
                     [owner, method](A... args) -> R
                     { return ((*owner).*method)(std::forward<A>(args)...); });
}

template <typename Owner, typename R, typename... A>
Tool make_tool(std::string name, std::string description, std::vector<ParamDoc> params,
               std::shared_ptr<Owner> owner, R (Owner::*method)(A...))
{
    return make_tool(std::move(name), std::move(description), std::move(params),
                     [owner, method](A... args) -> R
                     { return ((*owner).*method)(std::forward<A>(args)...); });
}

} // namespace mcpserve::tools
