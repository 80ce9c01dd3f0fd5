#include "mcpserve/settings.hpp"

#include "mcpserve/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcpserve
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v)
        return defv;
    try
    {
        size_t idx = 0;
        int parsed = std::stoi(v, &idx);
        if (idx != std::string(v).size())
            throw ConfigurationError(std::string(key) + " is not an integer: " + v);
        return parsed;
    }
    catch (const std::logic_error&)
    {
        throw ConfigurationError(std::string(key) + " is not an integer: " + v);
    }
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename T>
static void read_key(const Json& j, const char* key, T& out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    try
    {
        out = it->get<T>();
    }
    catch (const Json::exception&)
    {
        throw ConfigurationError(std::string("setting '") + key + "' has wrong type");
    }
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = upper(getenv_str("MCPSERVE_LOG_LEVEL", s.log_level));
    s.transport = lower(getenv_str("MCPSERVE_TRANSPORT", s.transport));
    s.host = getenv_str("MCPSERVE_HOST", s.host);
    s.port = getenv_int("MCPSERVE_PORT", s.port);
    s.sse_path = getenv_str("MCPSERVE_SSE_PATH", s.sse_path);
    s.message_path = getenv_str("MCPSERVE_MESSAGE_PATH", s.message_path);
    s.session_idle_timeout_ms =
        getenv_int("MCPSERVE_SESSION_IDLE_TIMEOUT_MS", s.session_idle_timeout_ms);
    s.keepalive_interval_ms = getenv_int("MCPSERVE_KEEPALIVE_INTERVAL_MS", s.keepalive_interval_ms);
    s.max_sessions = getenv_int("MCPSERVE_MAX_SESSIONS", s.max_sessions);
    s.max_queued_messages = getenv_int("MCPSERVE_MAX_QUEUED_MESSAGES", s.max_queued_messages);
    s.result_format = lower(getenv_str("MCPSERVE_RESULT_FORMAT", s.result_format));
    if (const char* v = std::getenv("MCPSERVE_INSTRUCTIONS"))
        s.instructions = std::string(v);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    s.merge_json(j);
    return s;
}

void Settings::merge_json(const Json& j)
{
    if (!j.is_object())
        throw ConfigurationError("settings must be a JSON object");
    read_key(j, "log_level", log_level);
    log_level = upper(log_level);
    read_key(j, "transport", transport);
    transport = lower(transport);
    read_key(j, "host", host);
    read_key(j, "port", port);
    read_key(j, "sse_path", sse_path);
    read_key(j, "message_path", message_path);
    read_key(j, "session_idle_timeout_ms", session_idle_timeout_ms);
    read_key(j, "keepalive_interval_ms", keepalive_interval_ms);
    read_key(j, "max_sessions", max_sessions);
    read_key(j, "max_queued_messages", max_queued_messages);
    read_key(j, "result_format", result_format);
    result_format = lower(result_format);
    if (j.contains("instructions") && !j["instructions"].is_null())
    {
        std::string text;
        read_key(j, "instructions", text);
        instructions = text;
    }
}

void Settings::validate() const
{
    if (transport != "stdio" && transport != "sse")
        throw ConfigurationError("unknown transport: " + transport);
    if (result_format != "raw" && result_format != "content")
        throw ConfigurationError("unknown result_format: " + result_format);
    if (port < 0 || port > 65535)
        throw ConfigurationError("port out of range: " + std::to_string(port));
    if (sse_path.empty() || sse_path[0] != '/')
        throw ConfigurationError("sse_path must start with '/'");
    if (message_path.empty() || message_path[0] != '/')
        throw ConfigurationError("message_path must start with '/'");
    if (sse_path == message_path)
        throw ConfigurationError("sse_path and message_path must differ");
    if (session_idle_timeout_ms <= 0 || keepalive_interval_ms <= 0)
        throw ConfigurationError("timeouts must be positive");
    if (max_sessions <= 0 || max_queued_messages <= 0)
        throw ConfigurationError("limits must be positive");
}

} // namespace mcpserve
