#pragma once
#include "mcpserve/outcome.hpp"
#include "mcpserve/schema/type_spec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace mcpserve::schema
{

/// Maps a C++ type to its TypeSpec.
///
/// Specialize for your own structs and provide nlohmann to_json/from_json:
/// ```cpp
/// struct Point { double x; double y; };
/// template <> struct mcpserve::schema::TypeOf<Point> {
///     static TypeSpec spec() {
///         return object({field("x", number()), field("y", number())});
///     }
/// };
/// ```
template <typename T, typename Enable = void>
struct TypeOf
{
    static_assert(sizeof(T) == 0, "no TypeOf specialization for this type");
};

template <typename T>
struct TypeOf<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
{
    static_assert(sizeof(T) >= 4, "integer parameters must be at least 32 bits wide");

    static TypeSpec spec()
    {
        if constexpr (std::is_signed_v<T>)
            return integer(sizeof(T) == 4 ? "int32" : "int64");
        else
            return integer(sizeof(T) == 4 ? "uint32" : "uint64");
    }
};

template <>
struct TypeOf<float>
{
    static TypeSpec spec()
    {
        return number("float");
    }
};

template <>
struct TypeOf<double>
{
    static TypeSpec spec()
    {
        return number("double");
    }
};

template <>
struct TypeOf<bool>
{
    static TypeSpec spec()
    {
        return boolean();
    }
};

template <>
struct TypeOf<std::string>
{
    static TypeSpec spec()
    {
        return string();
    }
};

template <>
struct TypeOf<Json>
{
    static TypeSpec spec()
    {
        return any();
    }
};

template <typename T>
struct TypeOf<std::optional<T>>
{
    static TypeSpec spec()
    {
        return optional(TypeOf<T>::spec());
    }
};

template <typename T>
struct TypeOf<std::vector<T>>
{
    static TypeSpec spec()
    {
        return array(TypeOf<T>::spec());
    }
};

template <typename T>
struct TypeOf<Outcome<T>>
{
    static TypeSpec spec()
    {
        return result(TypeOf<T>::spec());
    }
};

/// Conversion between decoded Json values and C++ values.
/// The default goes through nlohmann's get<T>() / to_json.
template <typename T>
struct Convert
{
    static T from(const Json& j)
    {
        return j.get<T>();
    }
    static Json to(const T& value)
    {
        return Json(value);
    }
};

template <>
struct Convert<Json>
{
    static Json from(const Json& j)
    {
        return j;
    }
    static Json to(const Json& value)
    {
        return value;
    }
};

template <typename T>
struct Convert<std::optional<T>>
{
    static std::optional<T> from(const Json& j)
    {
        if (j.is_null())
            return std::nullopt;
        return Convert<T>::from(j);
    }
    static Json to(const std::optional<T>& value)
    {
        if (!value)
            return nullptr;
        return Convert<T>::to(*value);
    }
};

template <typename T>
struct Convert<std::vector<T>>
{
    static std::vector<T> from(const Json& j)
    {
        std::vector<T> out;
        out.reserve(j.size());
        for (const auto& item : j)
            out.push_back(Convert<T>::from(item));
        return out;
    }
    static Json to(const std::vector<T>& value)
    {
        Json out = Json::array();
        for (const auto& item : value)
            out.push_back(Convert<T>::to(item));
        return out;
    }
};

} // namespace mcpserve::schema
