#include "mcpserve/mcp/engine.hpp"

#include "mcpserve/util/json.hpp"
#include "mcpserve/util/log.hpp"

#include <algorithm>

namespace mcpserve::mcp
{

using jsonrpc::make_error;
using jsonrpc::make_result;

ResultFormat result_format_from_string(const std::string& name)
{
    if (name == "raw")
        return ResultFormat::Raw;
    if (name == "content")
        return ResultFormat::Content;
    throw ConfigurationError("result_format must be \"raw\" or \"content\", got \"" + name + "\"");
}

Engine::Engine(ServerInfo info, const tools::ToolRegistry& registry, EngineOptions options)
    : info_(std::move(info)), registry_(registry), options_(std::move(options))
{
}

std::optional<Json> Engine::handle_line(const std::string& text) const
{
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
        return std::nullopt;

    Json message;
    try
    {
        message = util::json::parse(text);
    }
    catch (const Json::parse_error& e)
    {
        util::log::warn(std::string("discarding malformed message: ") + e.what());
        return make_error(nullptr, error_code::ParseError, "Parse error", Json{{"detail", e.what()}});
    }
    return handle(message);
}

std::optional<Json> Engine::handle(const Json& message) const
{
    jsonrpc::Request req;
    try
    {
        req = jsonrpc::parse_request(message);
    }
    catch (const ValidationError& e)
    {
        auto id = jsonrpc::recover_id(message);
        if (!id)
        {
            util::log::warn(std::string("invalid notification ignored: ") + e.what());
            return std::nullopt;
        }
        return make_error(*id, error_code::InvalidRequest, std::string("Invalid Request: ") + e.what());
    }

    util::log::debug("dispatch " + req.method +
                     (req.is_notification() ? " (notification)" : " id=" + util::json::dump(*req.id)));

    Json response = dispatch(req);
    if (req.is_notification())
    {
        if (response.contains("error"))
            util::log::warn("notification " + req.method +
                            " failed: " + response["error"].value("message", ""));
        return std::nullopt;
    }
    return response;
}

Json Engine::dispatch(const jsonrpc::Request& req) const
{
    const Json id = req.id ? *req.id : Json();
    const Json params = req.params.is_null() ? Json::object() : req.params;

    if (req.method == "initialize")
        return initialize(id, params);
    if (req.method == "notifications/initialized")
        return make_result(id, Json::object());
    if (req.method == "ping")
        return make_result(id, Json::object());
    if (req.method == "tools/list")
        return list_tools(id);
    if (req.method == "tools/call")
        return call_tool(id, params);

    return make_error(id, error_code::MethodNotFound, "Method not found: " + req.method,
                      Json{{"method", req.method}});
}

Json Engine::initialize(const Json& id, const Json& params) const
{
    std::string version = LATEST_PROTOCOL_VERSION;
    if (params.is_object())
    {
        auto requested = params.find("protocolVersion");
        if (requested != params.end() && requested->is_string())
        {
            const auto& supported = supported_protocol_versions();
            auto wanted = requested->get<std::string>();
            if (std::find(supported.begin(), supported.end(), wanted) != supported.end())
                version = wanted;
        }
        if (params.contains("clientInfo"))
            util::log::info("initialize from client " + util::json::dump(params["clientInfo"]));
    }

    Json result = {{"protocolVersion", version},
                   {"capabilities", Json{{"tools", Json{{"listChanged", false}}}}},
                   {"serverInfo", info_}};
    if (options_.instructions)
        result["instructions"] = *options_.instructions;
    return make_result(id, std::move(result));
}

Json Engine::list_tools(const Json& id) const
{
    return make_result(id, Json{{"tools", registry_.list()}});
}

Json Engine::call_tool(const Json& id, const Json& params) const
{
    if (!params.is_object())
        return make_error(id, error_code::InvalidParams, "tools/call params must be an object");

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string() || name_it->get<std::string>().empty())
        return make_error(id, error_code::InvalidParams, "Missing tool name");
    const std::string name = name_it->get<std::string>();

    Json arguments = Json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null())
    {
        if (!args_it->is_object())
            return make_error(id, error_code::InvalidParams, "tools/call arguments must be an object",
                              Json{{"path", "arguments"}});
        arguments = *args_it;
    }

    const tools::Tool* tool = registry_.find(name);
    if (!tool)
        return make_error(id, error_code::MethodNotFound, "Tool not found: " + name,
                          Json{{"tool", name}});

    tools::Arguments args;
    try
    {
        args = tool->decode(arguments);
    }
    catch (const DecodeError& e)
    {
        return make_error(id, error_code::InvalidParams, std::string("Invalid params: ") + e.what(),
                          Json{{"path", e.path()}});
    }

    try
    {
        ToolResult outcome = tool->invoke(args);
        if (outcome.ok())
            return make_result(id, encode_success(std::move(outcome.value())));

        const Failure& failure = outcome.failure();
        int code = is_application_code(failure.code) ? failure.code : error_code::ToolFailure;
        util::log::warn("tool " + name + " failed: " + failure.message);
        return make_error(id, code, failure.message, failure.data);
    }
    catch (const DecodeError& e)
    {
        return make_error(id, error_code::InvalidParams, std::string("Invalid params: ") + e.what(),
                          Json{{"path", e.path()}});
    }
    catch (const std::exception& e)
    {
        util::log::error("tool " + name + " raised: " + e.what());
        return make_error(id, error_code::InternalError, "Internal error");
    }
    catch (...)
    {
        util::log::error("tool " + name + " raised a non-standard exception");
        return make_error(id, error_code::InternalError, "Internal error");
    }
}

Json Engine::encode_success(Json value) const
{
    if (options_.result_format == ResultFormat::Raw)
        return value;

    std::string text = value.is_string() ? value.get<std::string>() : util::json::dump(value);
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", std::move(text)}}})},
                {"isError", false}};
}

} // namespace mcpserve::mcp
