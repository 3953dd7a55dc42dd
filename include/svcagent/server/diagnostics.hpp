#pragma once
#include "svcagent/tools/manager.hpp"
#include "svcagent/types.hpp"

#include <memory>
#include <string>

namespace httplib
{
class Server;
}

namespace svcagent::server
{

/// Read-only view served outside the JSON-RPC envelope: liveness and a plain tool listing.
struct Diagnostics
{
    ServerInfo info;
    std::shared_ptr<const tools::ToolManager> tools;

    /// {"status":"ok","server":name,"version":version,"tools_count":n}
    svcagent::Json health() const;
    /// {"tools":[{"name","description"}...],"count":n}
    svcagent::Json tool_listing() const;
    /// Server identity plus the endpoint map of the binding serving it.
    svcagent::Json index(const svcagent::Json& endpoints) const;
};

/// Mount GET /health, GET /tools and GET / on svr. Always answers 200.
void mount_diagnostics(httplib::Server& svr, const Diagnostics& diag, svcagent::Json endpoints,
                       const std::string& cors_origin);

} // namespace svcagent::server
