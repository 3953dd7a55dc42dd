#pragma once
#include "svcagent/services/conversation_source.hpp"
#include "svcagent/tools/manager.hpp"

#include <memory>
#include <string>

namespace svcagent::services
{

struct ServiceOptions
{
    /// Used to build a JsonDirectoryConversationSource when `conversations` is not set.
    std::string conversations_dir = "conversations";
    std::shared_ptr<const ConversationSource> conversations;
};

/// Registers get_health_advice, search_exercises, find_pharmacy,
/// get_government_service_info and create_cv. Returns the number of tools registered.
std::size_t register_service_tools(tools::ToolManager& manager, const ServiceOptions& options);

} // namespace svcagent::services
