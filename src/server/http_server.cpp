#include "svcagent/server/http_server.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/mcp/errors.hpp"
#include "svcagent/util/json.hpp"
#include "svcagent/util/log.hpp"

#include <httplib.h>

namespace svcagent::server
{

HttpServerWrapper::HttpServerWrapper(mcp::McpHandler handler, Diagnostics diagnostics,
                                     std::string host, int port,
                                     std::chrono::milliseconds request_timeout,
                                     std::string cors_origin, std::string mcp_path)
    : runner_(std::move(handler), request_timeout), diagnostics_(std::move(diagnostics)),
      host_(std::move(host)), port_(port), cors_origin_(std::move(cors_origin)),
      mcp_path_(std::move(mcp_path))
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

bool HttpServerWrapper::start()
{
    // Idempotent start: return false if already running
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    // Security: Set payload and timeout limits to prevent DoS
    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);                  // 30 second read timeout
    svr_->set_write_timeout(30, 0);                 // 30 second write timeout

    svr_->Post(mcp_path_,
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   // Security: Only set CORS header if explicitly configured
                   if (!cors_origin_.empty())
                       res.set_header("Access-Control-Allow-Origin", cors_origin_);

                   auto payload = util::json::try_parse(req.body);
                   if (!payload)
                   {
                       log::warning("rejected non-JSON payload on " + mcp_path_);
                       res.status = 400;
                       res.set_content(util::json::dump(mcp::make_error_response(
                                           svcagent::Json(), mcp::parse_error())),
                                       "application/json");
                       return;
                   }

                   try
                   {
                       auto out = runner_(*payload);
                       res.set_content(util::json::dump(out), "application/json");
                       res.status = 200;
                   }
                   catch (const std::exception& e)
                   {
                       svcagent::Json id = payload->is_object() && payload->contains("id")
                                               ? payload->at("id")
                                               : svcagent::Json();
                       res.status = 200;
                       res.set_content(util::json::dump(mcp::make_error_response(
                                           id, mcp::internal_error(e.what()))),
                                       "application/json");
                   }
               });

    // The envelope endpoint only accepts POST
    svr_->Get(mcp_path_,
              [this](const httplib::Request&, httplib::Response& res)
              {
                  res.status = 405;
                  res.set_header("Allow", "POST");
                  svcagent::Json error_response = {
                      {"error", "Method Not Allowed"},
                      {"message", "Send JSON-RPC envelopes with POST " + mcp_path_}};
                  res.set_content(error_response.dump(), "application/json");
              });

    mount_diagnostics(*svr_, diagnostics_,
                      svcagent::Json{{"mcp", mcp_path_ + " (POST)"},
                                     {"health", "/health"},
                                     {"tools", "/tools"}},
                      cors_origin_);

    if (!svr_->bind_to_port(host_, port_))
    {
        log::error("cannot bind " + host_ + ":" + std::to_string(port_));
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    svr_->wait_until_ready();
    log::info("HTTP transport listening on http://" + host_ + ":" + std::to_string(port_) +
              mcp_path_);
    return true;
}

void HttpServerWrapper::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
    {
        thread_.join();
        log::info("HTTP transport stopped");
    }
    running_ = false;
    svr_.reset();
}

} // namespace svcagent::server
