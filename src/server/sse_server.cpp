#include "mcpserve/server/sse_server.hpp"

#include "mcpserve/exceptions.hpp"
#include "mcpserve/util/json.hpp"
#include "mcpserve/util/log.hpp"

#include <algorithm>

namespace mcpserve::server
{

namespace
{
constexpr std::size_t MAX_PAYLOAD_BYTES = 10 * 1024 * 1024;
constexpr std::chrono::milliseconds POLL_INTERVAL{100};

std::string regex_escape(const std::string& text)
{
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (special.find(c) != std::string::npos)
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

void set_json_error(httplib::Response& res, int status, const std::string& message)
{
    res.status = status;
    res.set_content(util::json::dump(Json{{"error", message}}), "application/json");
}

bool write(httplib::DataSink& sink, const std::string& data)
{
    return sink.write(data.data(), data.size());
}
} // namespace

SseOptions SseOptions::from_settings(const Settings& settings)
{
    SseOptions options;
    options.host = settings.host;
    options.port = settings.port;
    options.sse_path = settings.sse_path;
    options.message_path = settings.message_path;
    options.keepalive_interval = std::chrono::milliseconds(settings.keepalive_interval_ms);
    options.session_idle_timeout = std::chrono::milliseconds(settings.session_idle_timeout_ms);
    return options;
}

SseServer::SseServer(McpServer& server, SseOptions options)
    : server_(server), options_(std::move(options)), port_(options_.port)
{
}

SseServer::~SseServer()
{
    stop();
}

bool SseServer::stream_session(httplib::DataSink& sink, const std::shared_ptr<Session>& session)
{
    std::string endpoint_evt = "event: endpoint\ndata: " + options_.message_path +
                               "?sessionId=" + session->id() + "\n\n";
    if (!write(sink, endpoint_evt))
        return false;

    auto wait = std::min(POLL_INTERVAL, options_.keepalive_interval);
    auto last_write = Session::Clock::now();

    while (running_ && session->alive())
    {
        auto batch = session->drain(wait);
        for (const auto& message : batch)
        {
            std::string evt = "event: message\ndata: " + util::json::dump(message) + "\n\n";
            if (!write(sink, evt))
            {
                util::log::warn("sse: lost stream for session " + session->id() +
                                " with undelivered messages");
                return false;
            }
            session->touch();
            last_write = Session::Clock::now();
        }

        if (Session::Clock::now() - last_write >= options_.keepalive_interval)
        {
            if (!write(sink, ": keep-alive\n\n"))
                return false;
            last_write = Session::Clock::now();
        }
    }
    return true;
}

void SseServer::handle_stream(const httplib::Request& req, httplib::Response& res)
{
    std::shared_ptr<Session> session;
    try
    {
        session = server_.sessions().create();
    }
    catch (const TransportError& e)
    {
        util::log::warn(std::string("sse: rejecting connection from ") + req.remote_addr + ": " +
                        e.what());
        set_json_error(res, 503, "Maximum connections reached");
        return;
    }

    util::log::info("sse: session " + session->id() + " opened by " + req.remote_addr);

    res.status = 200;
    res.set_header("Cache-Control", "no-cache, no-transform");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, session](size_t /*offset*/, httplib::DataSink& sink)
        {
            if (!stream_session(sink, session))
                return false;
            sink.done();
            return true;
        },
        [this, session](bool /*success*/)
        {
            server_.sessions().remove(session->id());
            util::log::info("sse: session " + session->id() + " closed");
        });
}

void SseServer::handle_message(const std::string& session_id, const httplib::Request& req,
                               httplib::Response& res)
{
    if (session_id.empty())
    {
        set_json_error(res, 400, "sessionId parameter required");
        return;
    }

    auto session = server_.sessions().find(session_id);
    if (!session || !session->alive())
    {
        set_json_error(res, 404, "Invalid or expired sessionId");
        return;
    }
    session->touch();

    Json message;
    try
    {
        message = util::json::parse(req.body);
    }
    catch (const Json::parse_error& e)
    {
        util::log::warn("sse: invalid JSON body for session " + session_id + ": " + e.what());
        set_json_error(res, 400, "Invalid JSON");
        return;
    }

    auto response = server_.engine().handle(message);
    if (response)
    {
        try
        {
            server_.sessions().deliver(session_id, std::move(*response));
        }
        catch (const TransportError& e)
        {
            util::log::warn(std::string("sse: delivery failed: ") + e.what());
        }
    }

    res.status = 202;
    res.set_content("Accepted", "text/plain");
}

void SseServer::setup_routes()
{
    svr_->Get(options_.sse_path, [this](const httplib::Request& req, httplib::Response& res)
              { handle_stream(req, res); });

    svr_->Post(options_.sse_path,
               [](const httplib::Request&, httplib::Response& res)
               {
                   res.set_header("Allow", "GET");
                   set_json_error(res, 405, "Method Not Allowed");
               });

    svr_->Post(options_.message_path,
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   std::string session_id;
                   if (req.has_param("sessionId"))
                       session_id = req.get_param_value("sessionId");
                   else if (req.has_param("session_id"))
                       session_id = req.get_param_value("session_id");
                   handle_message(session_id, req, res);
               });

    svr_->Post(regex_escape(options_.message_path) + "/([A-Za-z0-9_-]+)",
               [this](const httplib::Request& req, httplib::Response& res)
               { handle_message(req.matches[1].str(), req, res); });
}

void SseServer::reap_loop()
{
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (running_)
    {
        reaper_cv_.wait_for(lock, options_.reap_interval, [this] { return !running_; });
        if (!running_)
            break;
        lock.unlock();
        server_.sessions().reap_idle(options_.session_idle_timeout);
        lock.lock();
    }
}

bool SseServer::start()
{
    if (running_)
        return false;

    server_.start_serving();

    svr_ = std::make_unique<httplib::Server>();
    svr_->set_payload_max_length(MAX_PAYLOAD_BYTES);
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    // Each open stream occupies a worker for its whole lifetime
    std::size_t workers = server_.sessions().max_sessions() + 8;
    svr_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    setup_routes();

    if (options_.port == 0)
    {
        port_ = svr_->bind_to_any_port(options_.host.c_str());
        if (port_ < 0)
        {
            util::log::error("sse: could not bind " + options_.host);
            return false;
        }
    }
    else if (!svr_->bind_to_port(options_.host.c_str(), options_.port))
    {
        util::log::error("sse: could not bind " + options_.host + ":" +
                         std::to_string(options_.port));
        return false;
    }
    else
    {
        port_ = options_.port;
    }

    running_ = true;
    listen_thread_ = std::thread(
        [this]()
        {
            if (!svr_->listen_after_bind() && running_)
                util::log::error("sse: listener stopped unexpectedly");
            running_ = false;
        });
    reaper_thread_ = std::thread([this]() { reap_loop(); });

    util::log::info("sse: listening on http://" + options_.host + ":" + std::to_string(port_) +
                    options_.sse_path);
    return true;
}

void SseServer::stop()
{
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        running_ = false;
    }
    reaper_cv_.notify_all();

    server_.sessions().close_all();
    if (svr_)
        svr_->stop();
    if (listen_thread_.joinable())
        listen_thread_.join();
    if (reaper_thread_.joinable())
        reaper_thread_.join();
}

} // namespace mcpserve::server
