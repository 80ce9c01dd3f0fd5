#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcpserve
{

using Json = nlohmann::json;

constexpr const char* JSONRPC_VERSION = "2.0";
constexpr const char* LATEST_PROTOCOL_VERSION = "2024-11-05";

inline const std::vector<std::string>& supported_protocol_versions()
{
    static const std::vector<std::string> versions{"2024-11-05"};
    return versions;
}

/// JSON-RPC 2.0 error codes plus the application range used for tool failures.
namespace error_code
{
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;

/// Default code for a failure reported by a tool handler.
constexpr int ToolFailure = -32000;

constexpr int ApplicationMin = -32099;
constexpr int ApplicationMax = -32000;
} // namespace error_code

inline bool is_application_code(int code)
{
    return code >= error_code::ApplicationMin && code <= error_code::ApplicationMax;
}

/// Server identity returned from initialize
struct ServerInfo
{
    std::string name{"mcpserve"};
    std::string version{"1.0.0"};
};

// nlohmann::json adapters
inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}
inline void from_json(const Json& j, ServerInfo& info)
{
    info.name = j.at("name").get<std::string>();
    info.version = j.at("version").get<std::string>();
}

} // namespace mcpserve
