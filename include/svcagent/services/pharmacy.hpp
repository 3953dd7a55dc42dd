#pragma once
#include "svcagent/tools/tool.hpp"
#include "svcagent/types.hpp"

#include <string>
#include <vector>

namespace svcagent::services
{

/// On-duty pharmacies for a Burkina Faso city (default Ouagadougou); with emergency=true the
/// national emergency numbers are included.
Json find_pharmacy(const Json& args);

/// Display names of the cities in the directory.
std::vector<std::string> supported_cities();

tools::Tool pharmacy_tool();

} // namespace svcagent::services
