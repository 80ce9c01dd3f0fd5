#include "mcpserve/server/session.hpp"

#include "mcpserve/util/log.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace mcpserve::server
{

Session::Session(std::string id, std::size_t max_queue)
    : id_(std::move(id)), max_queue_(max_queue), last_activity_(Clock::now())
{
}

bool Session::push(Json message)
{
    {
        std::lock_guard<std::mutex> lock(m_);
        if (!alive_ || queue_.size() >= max_queue_)
            return false;
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

std::deque<Json> Session::drain(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || !alive_; });
    std::deque<Json> out;
    out.swap(queue_);
    return out;
}

void Session::close()
{
    {
        std::lock_guard<std::mutex> lock(m_);
        alive_ = false;
    }
    cv_.notify_all();
}

bool Session::alive() const
{
    std::lock_guard<std::mutex> lock(m_);
    return alive_;
}

void Session::touch()
{
    std::lock_guard<std::mutex> lock(m_);
    last_activity_ = Clock::now();
}

Session::Clock::duration Session::idle_for() const
{
    std::lock_guard<std::mutex> lock(m_);
    return Clock::now() - last_activity_;
}

std::size_t Session::pending() const
{
    std::lock_guard<std::mutex> lock(m_);
    return queue_.size();
}

SessionMap::SessionMap(std::size_t max_sessions, std::size_t max_queue)
    : max_sessions_(max_sessions), max_queue_(max_queue)
{
}

std::string SessionMap::generate_id()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

std::shared_ptr<Session> SessionMap::create()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sessions_.size() >= max_sessions_)
        throw TransportError("maximum number of sessions (" + std::to_string(max_sessions_) +
                             ") reached");

    std::string id = generate_id();
    while (sessions_.count(id))
        id = generate_id();

    auto session = std::make_shared<Session>(id, max_queue_);
    sessions_.emplace(id, session);
    return session;
}

std::shared_ptr<Session> SessionMap::find(const std::string& id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end())
        return nullptr;
    return it->second;
}

bool SessionMap::remove(const std::string& id)
{
    std::shared_ptr<Session> session;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end())
            return false;
        session = std::move(it->second);
        sessions_.erase(it);
    }
    session->close();
    return true;
}

void SessionMap::deliver(const std::string& id, Json message)
{
    auto session = find(id);
    if (!session)
        throw TransportError("unknown session " + id);
    if (!session->alive())
        throw TransportError("session " + id + " is closed");
    if (!session->push(std::move(message)))
        throw TransportError("session " + id + " rejected the message (closed or queue full)");
}

std::vector<std::string> SessionMap::reap_idle(std::chrono::milliseconds timeout)
{
    std::vector<std::shared_ptr<Session>> reaped;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (!it->second->alive() || it->second->idle_for() > timeout)
            {
                reaped.push_back(std::move(it->second));
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    std::vector<std::string> ids;
    ids.reserve(reaped.size());
    for (auto& session : reaped)
    {
        session->close();
        util::log::info("reaped idle session " + session->id());
        ids.push_back(session->id());
    }
    return ids;
}

void SessionMap::close_all()
{
    std::unordered_map<std::string, std::shared_ptr<Session>> closing;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        closing.swap(sessions_);
    }
    for (auto& entry : closing)
        entry.second->close();
}

std::size_t SessionMap::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace mcpserve::server
