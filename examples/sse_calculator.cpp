// Calculator tools over HTTP + Server-Sent Events.
//
//   ./sse_calculator 3000
//   curl -N http://127.0.0.1:3000/sse        # prints the endpoint event
//   curl -X POST 'http://127.0.0.1:3000/message?sessionId=<id>' \
//        -d '{"jsonrpc":"2.0","id":1,"method":"tools/list"}'
#include "demo_tools.hpp"
#include "mcpserve/server/mcp_server.hpp"
#include "mcpserve/server/sse_server.hpp"
#include "mcpserve/util/log.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace
{
volatile std::sig_atomic_t g_stop = 0;
void on_signal(int)
{
    g_stop = 1;
}
} // namespace

int main(int argc, char** argv)
{
    using namespace mcpserve;

    Settings settings;
    settings.transport = "sse";
    if (argc > 1)
        settings.port = std::atoi(argv[1]);
    settings.instructions = "Use tools/list to see available tools";

    server::McpServer srv(ServerInfo{"calculator", "1.0.0"}, settings);
    srv.add_toolset(demo::make_calculator_toolset());

    server::SseServer sse(srv, server::SseOptions::from_settings(settings));
    if (!sse.start())
    {
        std::cerr << "failed to start SSE server on port " << settings.port << "\n";
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_stop && sse.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    sse.stop();
    return 0;
}
