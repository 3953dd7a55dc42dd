#pragma once
#include "svcagent/tools/tool.hpp"
#include "svcagent/types.hpp"

namespace svcagent::services
{

/// Filter the static exercise catalogue. Every filter is optional and case-insensitive;
/// `name` is a substring match and `max_results` is clamped to [1, 30] (default 10).
Json search_exercises(const Json& args);

tools::Tool exercises_tool();

} // namespace svcagent::services
