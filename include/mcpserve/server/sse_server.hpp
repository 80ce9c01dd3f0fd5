#pragma once
#include "mcpserve/server/mcp_server.hpp"
#include "mcpserve/settings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpserve::server
{

struct SseOptions
{
    std::string host{"127.0.0.1"};
    /// 0 binds an ephemeral port; port() reports the one chosen
    int port{3000};
    std::string sse_path{"/sse"};
    std::string message_path{"/message"};
    std::chrono::milliseconds keepalive_interval{15000};
    std::chrono::milliseconds session_idle_timeout{300000};
    /// How often the reaper scans for idle sessions
    std::chrono::milliseconds reap_interval{1000};

    static SseOptions from_settings(const Settings& settings);
};

/**
 * SSE (Server-Sent Events) transport.
 *
 * - GET {sse_path}: opens a session and streams events to the client. The
 *   first event is `endpoint`, carrying `{message_path}?sessionId=<id>`;
 *   every JSON-RPC response for the session follows as a `message` event.
 * - POST {message_path}?sessionId=<id> (or {message_path}/<id>): one JSON-RPC
 *   message per body. The response goes to the session's stream; the POST
 *   itself is answered with 202 "Accepted".
 *
 * A background reaper closes sessions idle for longer than
 * session_idle_timeout, which ends their streams.
 *
 * Usage:
 *   SseServer sse(mcp_server, SseOptions::from_settings(settings));
 *   sse.start();  // Non-blocking - serves on background threads
 *   // ...
 *   sse.stop();
 */
class SseServer
{
  public:
    SseServer(McpServer& server, SseOptions options = {});
    ~SseServer();

    SseServer(const SseServer&) = delete;
    SseServer& operator=(const SseServer&) = delete;

    /**
     * Bind and start serving in the background.
     *
     * @return false if already running or the address could not be bound
     */
    bool start();

    /// Close every session, stop listening and join the worker threads. Idempotent.
    void stop();

    bool running() const
    {
        return running_.load();
    }

    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return options_.host;
    }
    const std::string& sse_path() const
    {
        return options_.sse_path;
    }
    const std::string& message_path() const
    {
        return options_.message_path;
    }

  private:
    void setup_routes();
    void handle_stream(const httplib::Request& req, httplib::Response& res);
    void handle_message(const std::string& session_id, const httplib::Request& req,
                        httplib::Response& res);
    bool stream_session(httplib::DataSink& sink, const std::shared_ptr<Session>& session);
    void reap_loop();

    McpServer& server_;
    SseOptions options_;
    int port_;

    std::unique_ptr<httplib::Server> svr_;
    std::thread listen_thread_;
    std::thread reaper_thread_;
    std::atomic<bool> running_{false};

    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
};

} // namespace mcpserve::server
