#pragma once
#include "svcagent/tools/tool.hpp"
#include "svcagent/types.hpp"

#include <string>
#include <vector>

namespace svcagent::services
{

/// Procedure sheet (documents, steps, cost, delay, office) for an administrative service.
/// service_name is required and matched against names and common aliases.
Json get_government_service_info(const Json& args);

/// Canonical service names, in display order.
std::vector<std::string> available_services();

tools::Tool government_services_tool();

} // namespace svcagent::services
