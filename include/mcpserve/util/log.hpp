#pragma once
#include <functional>
#include <string>

namespace mcpserve::util::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// Receives every record at or above the active level.
using LogCallback = std::function<void(Level, const std::string&)>;

/// "DEBUG", "INFO", "WARN"/"WARNING", "ERROR", "OFF"; unknown names map to Info.
Level level_from_string(const std::string& name);
const char* to_string(Level level);

void set_level(Level level);
Level level();
bool enabled(Level level);

/// Replace the output sink. An empty callback restores the stderr sink.
/// stdout is reserved for the stdio transport and is never written to.
/// A sink may itself log; calls from different threads are serialized.
void set_sink(LogCallback callback);

void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warn(const std::string& message)
{
    write(Level::Warn, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace mcpserve::util::log
