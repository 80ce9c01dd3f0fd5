#pragma once
#include "mcpserve/mcp/jsonrpc.hpp"
#include "mcpserve/tools/registry.hpp"
#include "mcpserve/types.hpp"

#include <optional>
#include <string>

namespace mcpserve::mcp
{

/// Shape of a successful tools/call result
enum class ResultFormat
{
    /// The encoded return value itself
    Raw,
    /// {"content":[{"type":"text","text":...}],"isError":false}
    Content
};

/// "raw" or "content"; throws ConfigurationError otherwise
ResultFormat result_format_from_string(const std::string& name);

struct EngineOptions
{
    ResultFormat result_format{ResultFormat::Raw};
    std::optional<std::string> instructions;
};

/// Transport-agnostic protocol state machine: one inbound message in, zero or
/// one outbound message out.
///
/// Every error raised while handling a message is converted to a JSON-RPC
/// error envelope here; nothing propagates to the transport. Requests with an
/// id always get exactly one response with the id echoed verbatim.
/// Notifications never get one.
///
/// handle() is const and may be called concurrently from several threads as
/// long as the registry is sealed.
class Engine
{
  public:
    Engine(ServerInfo info, const tools::ToolRegistry& registry, EngineOptions options = {});

    std::optional<Json> handle(const Json& message) const;

    /// Parses one line of text first; malformed JSON yields a ParseError
    /// response with a null id. Blank lines yield nothing.
    std::optional<Json> handle_line(const std::string& text) const;

    const ServerInfo& server_info() const
    {
        return info_;
    }
    const EngineOptions& options() const
    {
        return options_;
    }

  private:
    Json dispatch(const jsonrpc::Request& req) const;
    Json initialize(const Json& id, const Json& params) const;
    Json list_tools(const Json& id) const;
    Json call_tool(const Json& id, const Json& params) const;
    Json encode_success(Json value) const;

    ServerInfo info_;
    const tools::ToolRegistry& registry_;
    EngineOptions options_;
};

} // namespace mcpserve::mcp
