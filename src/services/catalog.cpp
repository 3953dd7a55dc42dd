#include "svcagent/services/catalog.hpp"

#include "svcagent/services/cv.hpp"
#include "svcagent/services/exercises.hpp"
#include "svcagent/services/government_services.hpp"
#include "svcagent/services/health_advice.hpp"
#include "svcagent/services/pharmacy.hpp"
#include "svcagent/util/log.hpp"

#include <string>
#include <vector>

namespace svcagent::services
{

std::size_t register_service_tools(tools::ToolManager& manager, const ServiceOptions& options)
{
    auto conversations = options.conversations;
    if (!conversations)
        conversations =
            std::make_shared<JsonDirectoryConversationSource>(options.conversations_dir);

    std::vector<tools::Tool> tools = {health_advice_tool(), exercises_tool(), pharmacy_tool(),
                                      government_services_tool(), cv_tool(conversations)};
    for (const auto& t : tools)
        manager.register_tool(t);

    log::info("registered " + std::to_string(tools.size()) + " service tools");
    return tools.size();
}

} // namespace svcagent::services
