#pragma once
#include "svcagent/types.hpp"

#include <optional>
#include <string>

namespace svcagent::services
{

// Accessors for tool arguments. A missing or null key yields the default; a value of the
// wrong JSON type throws ValidationError, which the service entry points turn into an
// error-shaped result.

std::optional<std::string> optional_string(const Json& args, const std::string& key);
std::string string_or(const Json& args, const std::string& key, const std::string& def);
int int_or(const Json& args, const std::string& key, int def);
bool bool_or(const Json& args, const std::string& key, bool def);

/// {"status":"error","message":message}
Json error_result(const std::string& message);

/// Lower-case ASCII letters and fold common Latin-1 accented letters (UTF-8) to ASCII.
std::string fold(const std::string& text);

/// Strip leading and trailing whitespace.
std::string trim(const std::string& text);

/// True when `needle` (already folded) occurs in fold(haystack).
bool contains_folded(const std::string& haystack, const std::string& needle);

} // namespace svcagent::services
