#pragma once
#include <functional>
#include <string>

namespace svcagent::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

/// Receives every message at or above the active threshold.
using Sink = std::function<void(Level, const std::string&)>;

std::string to_string(Level level);

/// Case-insensitive ("debug", "INFO", "warn", ...). Throws ConfigError on unknown names.
Level parse_level(const std::string& name);

void set_level(Level level);
Level level();

/// Replace the output sink. Passing nullptr restores the default stderr sink.
/// The sink runs outside the sink lock and may be called from several threads at once.
void set_sink(Sink sink);

bool enabled(Level level);
void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warning(const std::string& message)
{
    write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace svcagent::log
