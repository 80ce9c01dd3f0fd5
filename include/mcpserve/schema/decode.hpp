#pragma once
#include "mcpserve/exceptions.hpp"
#include "mcpserve/schema/type_spec.hpp"

#include <string>
#include <vector>

namespace mcpserve::schema
{

/// Validate instance against spec and return the normalized value.
///
/// Throws DecodeError naming the offending field path for missing required
/// fields, type mismatches, integers outside the declared width and unknown
/// enum values. Unknown extra object properties are ignored. Absent or null
/// optional fields decode to null.
Json decode(const TypeSpec& spec, const Json& instance, const std::string& path = "$");

/// Decode a tools/call "arguments" object against a parameter list.
/// Field paths are rooted at "arguments".
Json decode_arguments(const std::vector<FieldSpec>& params, const Json& arguments);

} // namespace mcpserve::schema
