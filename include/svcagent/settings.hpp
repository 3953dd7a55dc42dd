#pragma once
#include "svcagent/types.hpp"

#include <string>

namespace svcagent
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string host{"0.0.0.0"};
    int port{8000};
    std::string transport{"http"}; ///< "http" (unary POST /mcp) or "sse" (event stream)
    int request_timeout_ms{30000}; ///< 0 disables the per-request timeout
    std::string cors_origin;       ///< empty = no CORS header
    std::string conversations_dir{"conversations"};
    std::string instructions;

    static Settings from_env();
    static Settings from_json(const Json& j);
    static Settings from_file(const std::string& path);

    /// Overlay the keys present in j onto this instance.
    void merge_json(const Json& j);
    /// Overlay a JSON config file. Throws ConfigError if unreadable or not JSON.
    void merge_file(const std::string& path);

    /// Throws ConfigError when a field is out of range.
    void validate() const;
};

} // namespace svcagent
