#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace svcagent::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }

// Non-throwing variant used by the transports: discarded (invalid) input yields nullopt.
inline std::optional<json> try_parse(const std::string& s) {
  auto j = json::parse(s, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return std::nullopt;
  return j;
}

// Invalid UTF-8 coming from handlers is replaced rather than thrown at serialization time.
inline std::string dump(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
inline std::string dump_pretty(const json& j, int indent = 2) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace svcagent::util::json
