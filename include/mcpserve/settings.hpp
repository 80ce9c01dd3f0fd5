#pragma once
#include "mcpserve/types.hpp"

#include <optional>
#include <string>

namespace mcpserve
{

struct Settings
{
    std::string log_level{"INFO"};

    // Transport selection: "stdio" or "sse"
    std::string transport{"stdio"};

    // SSE transport
    std::string host{"127.0.0.1"};
    int port{3000};
    std::string sse_path{"/sse"};
    std::string message_path{"/message"};
    int session_idle_timeout_ms{300000};
    int keepalive_interval_ms{15000};
    int max_sessions{100};
    int max_queued_messages{1000};

    // tools/call result shape: "raw" or "content"
    std::string result_format{"raw"};

    std::optional<std::string> instructions;

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Overlay values present in j onto this instance.
    void merge_json(const Json& j);

    /// Throws ConfigurationError when a value is out of range.
    void validate() const;
};

} // namespace mcpserve
