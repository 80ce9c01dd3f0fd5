#pragma once
#include "mcpserve/types.hpp"

#include <string>

namespace mcpserve::util::json
{

/// Throws nlohmann::json::parse_error on malformed input.
inline Json parse(const std::string& s)
{
    return Json::parse(s);
}
inline std::string dump(const Json& j)
{
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

/// Short human-readable name of a JSON value's type ("integer", "string", ...)
inline std::string type_name(const Json& j)
{
    if (j.is_number_integer())
        return "integer";
    if (j.is_number_float())
        return "number";
    return j.type_name();
}

} // namespace mcpserve::util::json
