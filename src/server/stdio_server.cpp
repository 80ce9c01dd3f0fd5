#include "mcpserve/server/stdio_server.hpp"

#include "mcpserve/util/json.hpp"
#include "mcpserve/util/log.hpp"

#include <string>

namespace mcpserve::server
{

StdioServer::StdioServer(const mcp::Engine& engine, std::istream& in, std::ostream& out)
    : engine_(engine), in_(in), out_(out)
{
}

StdioServer::~StdioServer()
{
    stop();
}

void StdioServer::run_loop()
{
    std::string line;

    while (!stop_requested_ && std::getline(in_, line))
    {
        ++lines_read_;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        auto response = engine_.handle_line(line);
        if (!response)
            continue;

        out_ << util::json::dump(*response) << '\n';
        out_.flush();
        if (!out_)
        {
            util::log::error("stdio: write failed, closing transport");
            break;
        }
    }

    if (in_.eof())
        util::log::debug("stdio: end of input");
    running_ = false;
}

bool StdioServer::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    run_loop();

    return true;
}

bool StdioServer::start_async()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;

    thread_ = std::thread([this]() { run_loop(); });

    return true;
}

void StdioServer::stop()
{
    stop_requested_ = true;

    if (thread_.joinable())
        thread_.join();

    running_ = false;
}

} // namespace mcpserve::server
