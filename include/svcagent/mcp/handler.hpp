#pragma once
#include "svcagent/tools/manager.hpp"
#include "svcagent/types.hpp"

#include <functional>
#include <memory>

namespace svcagent::mcp
{

/// Protocol revision reported by initialize.
inline constexpr const char* PROTOCOL_VERSION = "2024-11-05";

/// A JSON-RPC request in, exactly one JSON-RPC response out. Never throws.
using McpHandler = std::function<svcagent::Json(const svcagent::Json&)>;

// Factory that produces the protocol dispatcher. Supported methods:
// - "initialize": protocol version, server identity and capabilities
// - "tools/list": every registered tool with its inputSchema
// - "tools/call": invoke a registered tool, result wrapped as text content
// Anything else answers -32601. Exceptions raised by tools become -32603 responses.
// The ToolManager is shared so the handler can outlive the composition scope.
McpHandler make_mcp_handler(ServerInfo info, std::shared_ptr<const tools::ToolManager> tools);

/// Result payload for initialize (exposed for the diagnostics endpoints and tests).
svcagent::Json initialize_result(const ServerInfo& info);

/// Result payload for tools/list.
svcagent::Json tools_list_result(const tools::ToolManager& tools);

/// Wrap a handler return value as a tools/call result: strings become the text verbatim,
/// anything else its compact JSON serialization.
svcagent::Json build_tool_result(const svcagent::Json& result);

} // namespace svcagent::mcp
