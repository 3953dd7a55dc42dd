/// @file catalog.cpp
/// @brief The service tools as seen through the protocol dispatcher

#include "svcagent/mcp/handler.hpp"
#include "svcagent/services/catalog.hpp"

#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace svcagent;

namespace
{
class NoConversations : public services::ConversationSource
{
  public:
    std::optional<Json> fetch(const std::string&) const override
    {
        return std::nullopt;
    }
};

Json call(const mcp::McpHandler& handler, int id, const std::string& name, const Json& args)
{
    return handler(Json{{"jsonrpc", "2.0"},
                        {"id", id},
                        {"method", "tools/call"},
                        {"params", {{"name", name}, {"arguments", args}}}});
}

Json payload(const Json& response)
{
    return Json::parse(response["result"]["content"][0]["text"].get<std::string>());
}
} // namespace

int main()
{
    auto tm = std::make_shared<tools::ToolManager>();
    services::ServiceOptions options;
    options.conversations = std::make_shared<NoConversations>();
    auto n = services::register_service_tools(*tm, options);
    assert(n == 5);

    auto names = tm->list_names();
    assert((names == std::vector<std::string>{"get_health_advice", "search_exercises",
                                              "find_pharmacy", "get_government_service_info",
                                              "create_cv"}));

    auto handler = mcp::make_mcp_handler(ServerInfo{}, tm);

    auto list = handler(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    assert(list["result"]["tools"].size() == 5);
    for (const auto& t : list["result"]["tools"])
    {
        assert(!t["description"].get<std::string>().empty());
        assert(t["inputSchema"]["type"] == "object");
    }

    // Successful calls carry the service document as JSON text
    auto pharmacy = payload(call(handler, 2, "find_pharmacy", Json{{"city", "Koudougou"}}));
    assert(pharmacy["status"] == "success");
    assert(pharmacy["city"] == "Koudougou");

    // Argument problems come back as results, not protocol errors
    auto resp = call(handler, 3, "get_health_advice", Json{{"symptoms", "a"}});
    assert(resp.contains("result"));
    assert(payload(resp)["status"] == "error");

    auto cv = call(handler, 4, "create_cv", Json{{"call_id", "c1"}, {"email", "x@y.bf"}});
    assert(cv.contains("result"));
    assert(payload(cv)["status"] == "error");

    // Registering twice replaces rather than duplicates
    services::register_service_tools(*tm, options);
    assert(tm->size() == 5);

    // Default options build a directory-backed source
    tools::ToolManager defaults;
    services::register_service_tools(defaults, services::ServiceOptions{});
    assert(defaults.contains("create_cv"));
    return 0;
}
