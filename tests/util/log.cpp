#include "svcagent/exceptions.hpp"
#include "svcagent/util/log.hpp"

#include <cassert>
#include <string>
#include <utility>
#include <vector>

int main()
{
    using namespace svcagent;

    assert(log::parse_level("debug") == log::Level::Debug);
    assert(log::parse_level("INFO") == log::Level::Info);
    assert(log::parse_level("Warn") == log::Level::Warning);
    assert(log::parse_level("critical") == log::Level::Error);
    assert(log::parse_level("off") == log::Level::Off);
    assert(log::to_string(log::Level::Warning) == "WARNING");

    bool threw = false;
    try
    {
        log::parse_level("loud");
    }
    catch (const ConfigError&)
    {
        threw = true;
    }
    assert(threw);

    std::vector<std::pair<log::Level, std::string>> seen;
    log::set_sink([&](log::Level level, const std::string& msg) { seen.emplace_back(level, msg); });

    log::set_level(log::Level::Warning);
    log::debug("hidden");
    log::info("hidden");
    log::warning("shown");
    log::error("also shown");
    assert(seen.size() == 2);
    assert(seen[0].first == log::Level::Warning);
    assert(seen[0].second == "shown");
    assert(seen[1].first == log::Level::Error);

    log::set_level(log::Level::Off);
    log::error("silenced");
    assert(seen.size() == 2);
    assert(!log::enabled(log::Level::Error));

    log::set_level(log::Level::Debug);
    log::debug("verbose");
    assert(seen.size() == 3);

    // A sink may log from inside itself
    std::vector<std::string> nested;
    log::set_sink(
        [&](log::Level, const std::string& msg)
        {
            nested.push_back(msg);
            if (msg == "outer")
                log::info("inner");
        });
    log::info("outer");
    assert((nested == std::vector<std::string>{"outer", "inner"}));

    log::set_sink(nullptr);
    log::set_level(log::Level::Info);
    return 0;
}
