#pragma once
#include "svcagent/tools/tool.hpp"
#include "svcagent/types.hpp"

namespace svcagent::services
{

/// Keyword match of free-text symptoms against a static table of common complaints.
/// Arguments: symptoms (required, >= 3 chars), age (default 30), sex (default "male").
Json get_health_advice(const Json& args);

tools::Tool health_advice_tool();

} // namespace svcagent::services
