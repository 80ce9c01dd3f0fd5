#include "mcpserve/server/mcp_server.hpp"

#include "mcpserve/util/log.hpp"

namespace mcpserve::server
{

namespace
{
Settings validated(Settings settings)
{
    settings.validate();
    return settings;
}

mcp::EngineOptions engine_options(const Settings& settings)
{
    mcp::EngineOptions options;
    options.result_format = mcp::result_format_from_string(settings.result_format);
    options.instructions = settings.instructions;
    return options;
}
} // namespace

McpServer::McpServer(ServerInfo info, Settings settings)
    : info_(std::move(info)), settings_(validated(std::move(settings))),
      sessions_(static_cast<std::size_t>(settings_.max_sessions),
                static_cast<std::size_t>(settings_.max_queued_messages)),
      engine_(info_, registry_, engine_options(settings_))
{
}

McpServer& McpServer::add_tool(const tools::Tool& tool)
{
    registry_.register_tool(tool);
    return *this;
}

McpServer& McpServer::add_toolset(const tools::Toolset& set)
{
    registry_.register_toolset(set);
    util::log::debug("registered toolset " + set.name_space() + " (" + std::to_string(set.size()) +
                     " tools)");
    return *this;
}

void McpServer::start_serving()
{
    if (registry_.sealed())
        return;
    registry_.seal();
    util::log::info(info_.name + " " + info_.version + " serving " +
                    std::to_string(registry_.size()) + " tools");
}

} // namespace mcpserve::server
