#include "mcpserve/schema/decode.hpp"

#include "mcpserve/util/json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace mcpserve::schema
{

namespace
{

std::string join(const std::string& path, const std::string& key)
{
    return path + "." + key;
}

[[noreturn]] void mismatch(const std::string& expected, const Json& instance,
                           const std::string& path)
{
    throw DecodeError(path, "expected " + expected + ", got " + util::json::type_name(instance));
}

// Accepted integer range for a declared width
bool in_range(const Json& instance, const std::string& format)
{
    if (instance.is_number_unsigned())
    {
        auto v = instance.get<uint64_t>();
        if (format == "int32")
            return v <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
        if (format == "uint32")
            return v <= std::numeric_limits<uint32_t>::max();
        if (format == "int64")
            return v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        return true;
    }
    auto v = instance.get<int64_t>();
    if (format == "int32")
        return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
    if (format == "uint32")
        return v >= 0 && v <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max());
    if (format == "uint64")
        return v >= 0;
    return true;
}

Json decode_integer(const TypeSpec& spec, const Json& instance, const std::string& path)
{
    Json value = instance;
    if (instance.is_number_float())
    {
        // 4.0 is accepted as 4; 4.5 is not an integer
        double d = instance.get<double>();
        if (!std::isfinite(d) || std::floor(d) != d || std::fabs(d) > 9007199254740992.0)
            mismatch("integer", instance, path);
        value = static_cast<int64_t>(d);
    }
    else if (!instance.is_number_integer())
    {
        mismatch("integer", instance, path);
    }
    if (spec.format && !in_range(value, *spec.format))
        throw DecodeError(path, "integer out of range for " + *spec.format);
    return value;
}

Json decode_number(const TypeSpec& spec, const Json& instance, const std::string& path)
{
    if (!instance.is_number())
        mismatch("number", instance, path);
    if (spec.format && *spec.format == "float" && instance.is_number_float())
    {
        double d = instance.get<double>();
        if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max())
            throw DecodeError(path, "number out of range for float");
    }
    return instance;
}

Json decode_enum(const TypeSpec& spec, const Json& instance, const std::string& path)
{
    if (!instance.is_string())
        mismatch("string", instance, path);
    const auto& v = instance.get_ref<const std::string&>();
    if (std::find(spec.enum_values.begin(), spec.enum_values.end(), v) == spec.enum_values.end())
    {
        std::string allowed;
        for (const auto& e : spec.enum_values)
        {
            if (!allowed.empty())
                allowed += ", ";
            allowed += e;
        }
        throw DecodeError(path, "unknown enum value '" + v + "' (expected one of: " + allowed + ")");
    }
    return instance;
}

Json decode_array(const TypeSpec& spec, const Json& instance, const std::string& path)
{
    if (!instance.is_array())
        mismatch("array", instance, path);
    Json out = Json::array();
    for (size_t i = 0; i < instance.size(); ++i)
    {
        auto idx_path = path + "[" + std::to_string(i) + "]";
        out.push_back(spec.element ? decode(*spec.element, instance[i], idx_path) : instance[i]);
    }
    return out;
}

Json decode_fields(const std::vector<FieldSpec>& fields, const Json& instance,
                   const std::string& path)
{
    if (!instance.is_object())
        mismatch("object", instance, path);
    Json out = Json::object();
    for (const auto& f : fields)
    {
        auto sub_path = join(path, f.name);
        auto it = instance.find(f.name);
        if (it == instance.end() || it->is_null())
        {
            if (f.required())
                throw DecodeError(sub_path, "missing required field '" + f.name + "'");
            out[f.name] = nullptr;
            continue;
        }
        out[f.name] = decode(f.type, *it, sub_path);
    }
    return out;
}

} // namespace

Json decode(const TypeSpec& spec, const Json& instance, const std::string& path)
{
    switch (spec.kind)
    {
    case TypeSpec::Kind::Optional:
        if (instance.is_null())
            return nullptr;
        return spec.element ? decode(*spec.element, instance, path) : instance;
    case TypeSpec::Kind::Result:
        // Only reachable through a misregistered parameter; registration rejects these
        throw DecodeError(path, "result wrapper cannot be decoded from a request");
    case TypeSpec::Kind::Integer:
        return decode_integer(spec, instance, path);
    case TypeSpec::Kind::Number:
        return decode_number(spec, instance, path);
    case TypeSpec::Kind::String:
        if (!instance.is_string())
            mismatch("string", instance, path);
        return instance;
    case TypeSpec::Kind::Boolean:
        if (!instance.is_boolean())
            mismatch("boolean", instance, path);
        return instance;
    case TypeSpec::Kind::Enum:
        return decode_enum(spec, instance, path);
    case TypeSpec::Kind::Array:
        return decode_array(spec, instance, path);
    case TypeSpec::Kind::Object:
        return decode_fields(spec.fields, instance, path);
    case TypeSpec::Kind::Any:
        return instance;
    }
    return instance;
}

Json decode_arguments(const std::vector<FieldSpec>& params, const Json& arguments)
{
    return decode_fields(params, arguments, "arguments");
}

} // namespace mcpserve::schema
