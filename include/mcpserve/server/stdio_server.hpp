#pragma once
#include "mcpserve/mcp/engine.hpp"

#include <atomic>
#include <iostream>
#include <thread>

namespace mcpserve::server
{

/**
 * Line-delimited JSON-RPC over a stream pair (stdin/stdout by default).
 *
 * Each input line is one JSON document. Messages are processed strictly in
 * order; each response is written as one line and flushed before the next
 * line is read. Nothing but responses is written to the output stream.
 *
 * Usage:
 *   StdioServer server(mcp_server.engine());
 *   server.run();  // Blocking - returns at EOF or after stop()
 */
class StdioServer
{
  public:
    explicit StdioServer(const mcp::Engine& engine, std::istream& in = std::cin,
                         std::ostream& out = std::cout);

    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    /**
     * Serve until end of input, stop(), or a failed write.
     *
     * @return false if already running
     */
    bool run();

    /**
     * Run the loop on a background thread.
     *
     * stop() only takes effect once the current read returns, so the input
     * stream must eventually deliver a line or EOF.
     */
    bool start_async();

    /// Request the loop to end and join the background thread. Idempotent.
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// Number of lines consumed so far
    std::size_t lines_read() const
    {
        return lines_read_.load();
    }

  private:
    void run_loop();

    const mcp::Engine& engine_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> lines_read_{0};
    std::thread thread_;
};

} // namespace mcpserve::server
