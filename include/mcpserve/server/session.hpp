#pragma once
#include "mcpserve/exceptions.hpp"
#include "mcpserve/types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpserve::server
{

/// One connected SSE client: an outbound message queue drained by the push
/// stream, plus the bookkeeping needed to reap it when idle.
class Session
{
  public:
    using Clock = std::chrono::steady_clock;

    Session(std::string id, std::size_t max_queue);

    const std::string& id() const
    {
        return id_;
    }

    /// Queue a message for the push stream. Returns false when the session
    /// is closed or its queue is full; the message is not queued then.
    bool push(Json message);

    /// Block until a message is queued, the session is closed, or timeout
    /// elapses; returns every queued message (possibly none).
    std::deque<Json> drain(std::chrono::milliseconds timeout);

    /// Mark closed and wake the stream. Idempotent.
    void close();
    bool alive() const;

    void touch();
    Clock::duration idle_for() const;

    std::size_t pending() const;

  private:
    std::string id_;
    std::size_t max_queue_;

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<Json> queue_;
    bool alive_{true};
    Clock::time_point last_activity_;
};

/// Concurrent id -> Session map shared by the HTTP layer and the engine's
/// delivery path. Lookups take a shared lock; insert and remove take an
/// exclusive one. Sessions are handed out as shared_ptr so a stream keeps
/// its session valid after removal from the map.
class SessionMap
{
  public:
    explicit SessionMap(std::size_t max_sessions = 100, std::size_t max_queue = 1000);

    /// Throws TransportError when max_sessions are already open.
    std::shared_ptr<Session> create();

    /// nullptr for unknown ids
    std::shared_ptr<Session> find(const std::string& id) const;

    /// Closes and forgets the session. Returns false for unknown ids.
    bool remove(const std::string& id);

    /// Route one outbound message to a session's push stream.
    /// Throws TransportError for an unknown or closed session or a full queue.
    void deliver(const std::string& id, Json message);

    /// Remove sessions idle for longer than timeout; returns their ids.
    std::vector<std::string> reap_idle(std::chrono::milliseconds timeout);

    void close_all();

    std::size_t size() const;
    std::size_t max_sessions() const
    {
        return max_sessions_;
    }

    /// 128 random bits as 32 hex characters
    static std::string generate_id();

  private:
    std::size_t max_sessions_;
    std::size_t max_queue_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace mcpserve::server
