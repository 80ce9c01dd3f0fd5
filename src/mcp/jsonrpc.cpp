#include "mcpserve/mcp/jsonrpc.hpp"

#include "mcpserve/util/json.hpp"

namespace mcpserve::mcp::jsonrpc
{

bool is_valid_id(const Json& id)
{
    return id.is_string() || id.is_number_integer();
}

Request parse_request(const Json& message)
{
    if (!message.is_object())
        throw ValidationError("request must be a JSON object, got " +
                              util::json::type_name(message));

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() ||
        version->get<std::string>() != JSONRPC_VERSION)
        throw ValidationError("\"jsonrpc\" must be \"2.0\"");

    Request req;
    auto id = message.find("id");
    if (id != message.end())
    {
        if (!is_valid_id(*id))
            throw ValidationError("\"id\" must be a string or an integer, got " +
                                  util::json::type_name(*id));
        req.id = *id;
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string())
        throw ValidationError("\"method\" must be a string");
    req.method = method->get<std::string>();

    auto params = message.find("params");
    if (params != message.end() && !params->is_null())
    {
        if (!params->is_object() && !params->is_array())
            throw ValidationError("\"params\" must be an object or an array");
        req.params = *params;
    }
    return req;
}

std::optional<Json> recover_id(const Json& message)
{
    if (!message.is_object())
        return Json();
    auto id = message.find("id");
    if (id == message.end())
        return std::nullopt;
    if (!is_valid_id(*id))
        return Json();
    return *id;
}

Json make_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", std::move(result)}};
}

Json make_error(const Json& id, int code, const std::string& message, const Json& data)
{
    Json error{{"code", code}, {"message", message}};
    if (!data.is_null())
        error["data"] = data;
    return Json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"error", std::move(error)}};
}

} // namespace mcpserve::mcp::jsonrpc
