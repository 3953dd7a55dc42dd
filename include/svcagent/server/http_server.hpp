#pragma once
#include "svcagent/mcp/handler.hpp"
#include "svcagent/server/diagnostics.hpp"
#include "svcagent/server/request_runner.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace svcagent::server
{

/**
 * Unary HTTP binding: one JSON-RPC envelope per POST.
 *
 * Routes:
 * - POST <mcp_path> (default "/mcp"): body decoded as JSON and handed to the handler; the
 *   response envelope is returned with status 200. A body that is not JSON is rejected with
 *   status 400 and a Parse Error envelope (id null) before the handler sees it.
 * - GET /health, GET /tools, GET /: diagnostics (see Diagnostics).
 */
class HttpServerWrapper
{
  public:
    /**
     * @param handler JSON-RPC handler, usually from mcp::make_mcp_handler()
     * @param diagnostics Identity and registry shown on the diagnostics endpoints
     * @param host Host address to bind to (default: "127.0.0.1" for localhost)
     * @param port Port to listen on (default: 8000)
     * @param request_timeout Per-request handler timeout, 0 disables
     * @param cors_origin Optional CORS origin to allow (empty = no CORS header)
     * @param mcp_path Path of the envelope endpoint
     */
    HttpServerWrapper(mcp::McpHandler handler, Diagnostics diagnostics,
                      std::string host = "127.0.0.1", int port = 8000,
                      std::chrono::milliseconds request_timeout = std::chrono::milliseconds(30000),
                      std::string cors_origin = "", std::string mcp_path = "/mcp");
    ~HttpServerWrapper();

    /// Bind and serve on a background thread. False if already running or the bind failed.
    bool start();
    void stop();
    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }
    const std::string& mcp_path() const
    {
        return mcp_path_;
    }

  private:
    RequestRunner runner_;
    Diagnostics diagnostics_;
    std::string host_;
    int port_;
    std::string cors_origin_; // Optional CORS origin (empty = no CORS)
    std::string mcp_path_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace svcagent::server
