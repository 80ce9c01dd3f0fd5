#include "demo_tools.hpp"
#include "mcpserve/exceptions.hpp"
#include "mcpserve/server/mcp_server.hpp"
#include "mcpserve/server/sse_server.hpp"
#include "mcpserve/server/stdio_server.hpp"
#include "mcpserve/settings.hpp"
#include "mcpserve/util/log.hpp"
#include "mcpserve/version.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int)
{
    g_stop = 1;
}

int usage(int exit_code = 1)
{
    std::ostream& os = exit_code == 0 ? std::cout : std::cerr;
    os << "mcpserve " << mcpserve::VERSION_MAJOR << "." << mcpserve::VERSION_MINOR << "."
       << mcpserve::VERSION_PATCH << "\n";
    os << "Usage:\n";
    os << "  mcpserve [--stdio | --sse] [options]\n";
    os << "\n";
    os << "Options:\n";
    os << "  --stdio                    Serve line-delimited JSON-RPC on stdin/stdout (default)\n";
    os << "  --sse                      Serve HTTP + Server-Sent Events\n";
    os << "  --host <addr>              SSE bind address (default 127.0.0.1)\n";
    os << "  --port <n>                 SSE port (default 3000, 0 = ephemeral)\n";
    os << "  --log-level <level>        DEBUG, INFO, WARN, ERROR or OFF\n";
    os << "  --result-format <format>   raw or content\n";
    os << "  --instructions <text>      Text returned from initialize\n";
    os << "  --version                  Print the version and exit\n";
    os << "  --help                     Show this message\n";
    os << "\n";
    os << "Environment: MCPSERVE_TRANSPORT, MCPSERVE_HOST, MCPSERVE_PORT, MCPSERVE_LOG_LEVEL,\n";
    os << "MCPSERVE_RESULT_FORMAT, MCPSERVE_INSTRUCTIONS and friends; flags take precedence.\n";
    return exit_code;
}

std::optional<std::string> consume_flag_value(std::vector<std::string>& args, std::size_t& i)
{
    if (i + 1 >= args.size())
        return std::nullopt;
    return args[++i];
}

int parse_port(const std::string& text)
{
    std::size_t idx = 0;
    int port = 0;
    try
    {
        port = std::stoi(text, &idx);
    }
    catch (const std::logic_error&)
    {
        throw mcpserve::ConfigurationError("--port expects an integer, got " + text);
    }
    if (idx != text.size())
        throw mcpserve::ConfigurationError("--port expects an integer, got " + text);
    return port;
}

int serve_sse(mcpserve::server::McpServer& srv)
{
    mcpserve::server::SseServer sse(srv, mcpserve::server::SseOptions::from_settings(srv.settings()));
    if (!sse.start())
    {
        std::cerr << "mcpserve: could not listen on " << srv.settings().host << ":"
                  << srv.settings().port << "\n";
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_stop && sse.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    mcpserve::util::log::info("shutting down");
    sse.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace mcpserve;

    std::vector<std::string> args(argv + 1, argv + argc);

    try
    {
        Settings settings = Settings::from_env();

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string& arg = args[i];
            if (arg == "--help" || arg == "-h")
                return usage(0);
            if (arg == "--version")
            {
                std::cout << VERSION_STRING << "\n";
                return 0;
            }
            if (arg == "--stdio")
            {
                settings.transport = "stdio";
                continue;
            }
            if (arg == "--sse")
            {
                settings.transport = "sse";
                continue;
            }

            if (arg != "--host" && arg != "--port" && arg != "--log-level" &&
                arg != "--result-format" && arg != "--instructions")
            {
                std::cerr << "mcpserve: unknown option " << arg << "\n";
                return usage();
            }
            auto value = consume_flag_value(args, i);
            if (!value)
            {
                std::cerr << "mcpserve: " << arg << " requires a value\n";
                return usage();
            }
            if (arg == "--host")
                settings.host = *value;
            else if (arg == "--port")
                settings.port = parse_port(*value);
            else if (arg == "--log-level")
                settings.log_level = *value;
            else if (arg == "--result-format")
                settings.result_format = *value;
            else
                settings.instructions = *value;
        }

        util::log::set_level(util::log::level_from_string(settings.log_level));

        server::McpServer srv(ServerInfo{"mcpserve", VERSION_STRING}, settings);
        srv.add_toolset(demo::make_calculator_toolset());
        srv.add_toolset(demo::make_counter_toolset(std::make_shared<demo::Counter>()));
        srv.start_serving();

        if (settings.transport == "sse")
            return serve_sse(srv);

        server::StdioServer stdio(srv.engine());
        stdio.run();
        return 0;
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "mcpserve: configuration error: " << e.what() << "\n";
        return 1;
    }
}
