#include "svcagent/settings.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace svcagent
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        size_t pos = 0;
        int out = std::stoi(v, &pos);
        if (pos != std::string(v).size())
            throw ConfigError(std::string(key) + " is not an integer: " + v);
        return out;
    }
    catch (const std::logic_error&)
    {
        throw ConfigError(std::string(key) + " is not an integer: " + v);
    }
}

static int json_int(const Json& j, const char* key)
{
    const Json& v = j.at(key);
    if (v.is_number_unsigned())
    {
        auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return static_cast<int>(u);
    }
    else if (v.is_number_integer())
    {
        auto i = v.get<std::int64_t>();
        if (i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max())
            return static_cast<int>(i);
    }
    else
    {
        return v.get<int>();
    }
    throw ConfigError(std::string(key) + " is out of range: " + v.dump());
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("SVCAGENT_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.host = getenv_str("SVCAGENT_HOST", s.host);
    s.port = getenv_int("SVCAGENT_PORT", s.port);
    s.transport = getenv_str("SVCAGENT_TRANSPORT", s.transport);
    s.request_timeout_ms = getenv_int("SVCAGENT_REQUEST_TIMEOUT_MS", s.request_timeout_ms);
    s.cors_origin = getenv_str("SVCAGENT_CORS_ORIGIN", s.cors_origin);
    s.conversations_dir = getenv_str("SVCAGENT_CONVERSATIONS_DIR", s.conversations_dir);
    s.instructions = getenv_str("SVCAGENT_INSTRUCTIONS", s.instructions);
    return s;
}

void Settings::merge_json(const Json& j)
{
    if (!j.is_object())
        throw ConfigError("settings document must be a JSON object");
    try
    {
        if (j.contains("log_level"))
            log_level = j.at("log_level").get<std::string>();
        if (j.contains("host"))
            host = j.at("host").get<std::string>();
        if (j.contains("port"))
            port = json_int(j, "port");
        if (j.contains("transport"))
            transport = j.at("transport").get<std::string>();
        if (j.contains("request_timeout_ms"))
            request_timeout_ms = json_int(j, "request_timeout_ms");
        if (j.contains("cors_origin"))
            cors_origin = j.at("cors_origin").get<std::string>();
        if (j.contains("conversations_dir"))
            conversations_dir = j.at("conversations_dir").get<std::string>();
        if (j.contains("instructions"))
            instructions = j.at("instructions").get<std::string>();
    }
    catch (const Json::type_error& e)
    {
        throw ConfigError(std::string("invalid settings value: ") + e.what());
    }
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    s.merge_json(j);
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    Settings s;
    s.merge_file(path);
    return s;
}

void Settings::merge_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open config file: " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    auto j = Json::parse(ss.str(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded())
        throw ConfigError("config file is not valid JSON: " + path);
    merge_json(j);
}

void Settings::validate() const
{
    if (transport != "http" && transport != "sse")
        throw ConfigError("transport must be 'http' or 'sse', got '" + transport + "'");
    if (port < 0 || port > 65535)
        throw ConfigError("port out of range: " + std::to_string(port));
    if (request_timeout_ms < 0)
        throw ConfigError("request_timeout_ms must be >= 0");
    if (host.empty())
        throw ConfigError("host must not be empty");
    log::parse_level(log_level);
}

} // namespace svcagent
