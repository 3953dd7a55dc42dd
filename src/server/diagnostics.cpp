#include "svcagent/server/diagnostics.hpp"

#include "svcagent/util/json.hpp"

#include <httplib.h>

namespace svcagent::server
{

namespace
{
std::size_t tool_count(const Diagnostics& diag)
{
    return diag.tools ? diag.tools->size() : 0;
}
} // namespace

svcagent::Json Diagnostics::health() const
{
    return svcagent::Json{{"status", "ok"},
                          {"server", info.name},
                          {"version", info.version},
                          {"tools_count", tool_count(*this)}};
}

svcagent::Json Diagnostics::tool_listing() const
{
    svcagent::Json list = svcagent::Json::array();
    if (tools)
        for (const auto& t : tools->list())
            list.push_back({{"name", t.name()}, {"description", t.description()}});
    auto count = list.size();
    return svcagent::Json{{"tools", std::move(list)}, {"count", count}};
}

svcagent::Json Diagnostics::index(const svcagent::Json& endpoints) const
{
    return svcagent::Json{{"name", info.name},
                          {"description", info.description},
                          {"version", info.version},
                          {"endpoints", endpoints},
                          {"tools_count", tool_count(*this)}};
}

void mount_diagnostics(httplib::Server& svr, const Diagnostics& diag, svcagent::Json endpoints,
                       const std::string& cors_origin)
{
    auto reply = [cors_origin](httplib::Response& res, const svcagent::Json& body)
    {
        if (!cors_origin.empty())
            res.set_header("Access-Control-Allow-Origin", cors_origin);
        res.status = 200;
        res.set_content(util::json::dump(body), "application/json");
    };

    svr.Get("/health", [diag, reply](const httplib::Request&, httplib::Response& res)
            { reply(res, diag.health()); });

    svr.Get("/tools", [diag, reply](const httplib::Request&, httplib::Response& res)
            { reply(res, diag.tool_listing()); });

    svr.Get("/", [diag, reply, endpoints = std::move(endpoints)](const httplib::Request&,
                                                                 httplib::Response& res)
            { reply(res, diag.index(endpoints)); });
}

} // namespace svcagent::server
