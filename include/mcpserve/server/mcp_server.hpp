#pragma once
#include "mcpserve/mcp/engine.hpp"
#include "mcpserve/server/session.hpp"
#include "mcpserve/settings.hpp"
#include "mcpserve/tools/registry.hpp"
#include "mcpserve/types.hpp"

namespace mcpserve::server
{

/// Process-wide server context handed to every transport.
///
/// Owns the tool registry, the SSE session map and the engine. Tools are
/// registered first; start_serving() then seals the registry and no further
/// registration is accepted.
///
/// ```cpp
/// McpServer server({"calc", "1.0.0"}, Settings::from_env());
/// server.add_toolset(make_calculator_toolset());
/// server.start_serving();
/// StdioServer(server.engine()).run();
/// ```
class McpServer
{
  public:
    McpServer(ServerInfo info, Settings settings = {});

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Throws ConfigurationError (duplicate name, invalid tool, already serving)
    McpServer& add_tool(const tools::Tool& tool);
    McpServer& add_toolset(const tools::Toolset& set);

    /// Seal the registry. Idempotent.
    void start_serving();
    bool serving() const
    {
        return registry_.sealed();
    }

    const ServerInfo& info() const
    {
        return info_;
    }
    const Settings& settings() const
    {
        return settings_;
    }
    const tools::ToolRegistry& registry() const
    {
        return registry_;
    }
    const mcp::Engine& engine() const
    {
        return engine_;
    }
    SessionMap& sessions()
    {
        return sessions_;
    }

  private:
    ServerInfo info_;
    Settings settings_;
    tools::ToolRegistry registry_;
    SessionMap sessions_;
    mcp::Engine engine_;
};

} // namespace mcpserve::server
