#include "mcpserve/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcpserve::util::log
{

namespace
{
std::atomic<Level> g_level{Level::Info};
std::mutex g_sink_mutex;
// Serializes output; recursive so a sink may itself log
std::recursive_mutex g_write_mutex;
LogCallback g_sink;

void default_sink(Level level, const std::string& message)
{
    std::cerr << "[mcpserve] " << to_string(level) << " " << message << std::endl;
}
} // namespace

Level level_from_string(const std::string& name)
{
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (n == "DEBUG" || n == "TRACE")
        return Level::Debug;
    if (n == "WARN" || n == "WARNING")
        return Level::Warn;
    if (n == "ERROR")
        return Level::Error;
    if (n == "OFF" || n == "NONE")
        return Level::Off;
    return Level::Info;
}

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

void set_level(Level level)
{
    g_level = level;
}

Level level()
{
    return g_level.load();
}

bool enabled(Level level)
{
    return level != Level::Off && level >= g_level.load();
}

void set_sink(LogCallback callback)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(callback);
}

void write(Level level, const std::string& message)
{
    if (!enabled(level))
        return;
    LogCallback sink;
    {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        sink = g_sink;
    }
    std::lock_guard<std::recursive_mutex> lock(g_write_mutex);
    if (sink)
        sink(level, message);
    else
        default_sink(level, message);
}

} // namespace mcpserve::util::log
