#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace svcagent
{

using Json = nlohmann::json;

/// Identity advertised in the initialize handshake and on the diagnostics endpoints.
struct ServerInfo
{
    std::string name{"services-agent"};
    std::string version{"2.0.0"};
    std::string description{
        "Agent de services - Santé, exercices, pharmacies, démarches administratives et CV"};
    std::optional<std::string> instructions;
};

// nlohmann::json adapters
inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}

inline void from_json(const Json& j, ServerInfo& info)
{
    info.name = j.at("name").get<std::string>();
    if (j.contains("version"))
        info.version = j["version"].get<std::string>();
    if (j.contains("description"))
        info.description = j["description"].get<std::string>();
    if (j.contains("instructions") && j["instructions"].is_string())
        info.instructions = j["instructions"].get<std::string>();
}

} // namespace svcagent
