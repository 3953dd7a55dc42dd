#include "svcagent/util/log.hpp"

#include "svcagent/exceptions.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace svcagent::log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_sink_mutex;
std::mutex g_stderr_mutex;

void stderr_sink(Level level, const std::string& message)
{
    std::string line = "[svcagent] " + to_string(level) + " " + message + "\n";
    std::lock_guard<std::mutex> lock(g_stderr_mutex);
    std::cerr << line << std::flush;
}

Sink& sink_ref()
{
    static Sink sink = stderr_sink;
    return sink;
}
} // namespace

std::string to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

Level parse_level(const std::string& name)
{
    std::string lvl = name;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (lvl == "DEBUG" || lvl == "TRACE")
        return Level::Debug;
    if (lvl == "INFO")
        return Level::Info;
    if (lvl == "WARNING" || lvl == "WARN")
        return Level::Warning;
    if (lvl == "ERROR" || lvl == "CRITICAL")
        return Level::Error;
    if (lvl == "OFF" || lvl == "NONE")
        return Level::Off;
    throw ConfigError("unknown log level: " + name);
}

void set_level(Level level)
{
    g_level.store(static_cast<int>(level));
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    sink_ref() = sink ? std::move(sink) : Sink(stderr_sink);
}

bool enabled(Level level)
{
    return level != Level::Off && static_cast<int>(level) >= g_level.load();
}

void write(Level level, const std::string& message)
{
    if (!enabled(level))
        return;
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        sink = sink_ref();
    }
    sink(level, message);
}

} // namespace svcagent::log
