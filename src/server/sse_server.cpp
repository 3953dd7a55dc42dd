#include "svcagent/server/sse_server.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/mcp/errors.hpp"
#include "svcagent/util/json.hpp"
#include "svcagent/util/log.hpp"

#include <chrono>
#include <httplib.h>
#include <iomanip>
#include <random>
#include <sstream>

namespace svcagent::server
{

SseServerWrapper::SseServerWrapper(mcp::McpHandler handler, Diagnostics diagnostics,
                                   std::string host, int port,
                                   std::chrono::milliseconds request_timeout,
                                   std::string sse_path, std::string message_path,
                                   std::string cors_origin)
    : runner_(std::move(handler), request_timeout), diagnostics_(std::move(diagnostics)),
      host_(std::move(host)), port_(port), sse_path_(std::move(sse_path)),
      message_path_(std::move(message_path)), cors_origin_(std::move(cors_origin))
{
}

SseServerWrapper::~SseServerWrapper()
{
    stop();
}

std::size_t SseServerWrapper::session_count() const
{
    std::lock_guard<std::mutex> lock(conns_mutex_);
    return connections_.size();
}

std::string SseServerWrapper::generate_session_id()
{
    // 128 random bits as 32 hex chars
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

void SseServerWrapper::handle_sse_connection(httplib::DataSink& sink,
                                             std::shared_ptr<ConnectionState> conn,
                                             const std::string& session_id)
{
    // Send initial comment to establish connection
    std::string welcome = ": SSE connection established\n\n";
    if (!sink.write(welcome.data(), welcome.size()))
    {
        conn->alive = false;
        return;
    }

    // The endpoint event tells the client where to POST its envelopes
    std::string endpoint_path = message_path_ + "?session_id=" + session_id;
    std::string endpoint_evt = "event: endpoint\ndata: " + endpoint_path + "\n\n";
    if (!sink.write(endpoint_evt.data(), endpoint_evt.size()))
    {
        conn->alive = false;
        return;
    }

    auto last_heartbeat = std::chrono::steady_clock::now();
    int heartbeat_counter = 0;

    while (running_)
    {
        std::unique_lock<std::mutex> lock(conn->m);
        conn->cv.wait_for(lock, std::chrono::milliseconds(100),
                          [&] { return !conn->queue.empty() || !running_ || !conn->alive; });

        if (!running_ || !conn->alive)
            break;

        while (!conn->queue.empty())
        {
            auto event = conn->queue.front();
            conn->queue.pop_front();

            // Release lock while writing to avoid blocking producers
            lock.unlock();

            std::string sse_data = "event: message\ndata: " + util::json::dump(event) + "\n\n";
            if (!sink.write(sse_data.data(), sse_data.size()))
            {
                conn->alive = false;
                return;
            }

            lock.lock();
            last_heartbeat = std::chrono::steady_clock::now();
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_heartbeat > std::chrono::seconds(15))
        {
            lock.unlock();
            std::string hb =
                "event: heartbeat\ndata: " + std::to_string(++heartbeat_counter) + "\n\n";
            if (!sink.write(hb.data(), hb.size()))
            {
                conn->alive = false;
                return;
            }
            last_heartbeat = now;
            lock.lock();
        }
    }
    conn->alive = false;
}

bool SseServerWrapper::send_event_to_session(const std::string& session_id,
                                             const svcagent::Json& event)
{
    std::lock_guard<std::mutex> lock(conns_mutex_);
    auto it = connections_.find(session_id);
    if (it == connections_.end())
        return false;

    auto& conn = it->second;
    if (!conn->alive)
    {
        connections_.erase(it);
        return false;
    }

    {
        std::lock_guard<std::mutex> ql(conn->m);
        // Drop oldest event when queue is full
        if (conn->queue.size() >= MAX_QUEUE_SIZE)
            conn->queue.pop_front();
        conn->queue.push_back(event);
    }
    conn->cv.notify_one();
    return true;
}

bool SseServerWrapper::start()
{
    if (running_)
        return false;

    svr_ = std::make_unique<httplib::Server>();

    // Security: Set payload and timeout limits to prevent DoS
    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);                  // 30 second read timeout
    svr_->set_write_timeout(30, 0);                 // 30 second write timeout

    svr_->Get(sse_path_,
              [this](const httplib::Request&, httplib::Response& res)
              {
                  {
                      std::lock_guard<std::mutex> lock(conns_mutex_);
                      if (connections_.size() >= MAX_CONNECTIONS)
                      {
                          log::warning("SSE stream refused: connection limit reached");
                          res.status = 503; // Service Unavailable
                          res.set_content("{\"error\":\"Maximum connections reached\"}",
                                          "application/json");
                          return;
                      }
                  }

                  res.status = 200;
                  res.set_header("Cache-Control", "no-cache, no-transform");
                  res.set_header("Connection", "keep-alive");
                  if (!cors_origin_.empty())
                      res.set_header("Access-Control-Allow-Origin", cors_origin_);
                  res.set_header("X-Accel-Buffering", "no");

                  res.set_chunked_content_provider(
                      "text/event-stream",
                      [this](size_t /*offset*/, httplib::DataSink& sink)
                      {
                          auto session_id = generate_session_id();
                          auto conn = std::make_shared<ConnectionState>();
                          conn->session_id = session_id;

                          {
                              std::lock_guard<std::mutex> lock(conns_mutex_);
                              connections_[session_id] = conn;
                          }
                          log::debug("SSE stream opened: " + session_id);

                          handle_sse_connection(sink, conn, session_id);

                          {
                              std::lock_guard<std::mutex> lock(conns_mutex_);
                              connections_.erase(session_id);
                          }
                          log::debug("SSE stream closed: " + session_id);

                          return false; // End stream when handle_sse_connection returns
                      },
                      [](bool) {});
              });

    // The SSE endpoint only supports GET
    svr_->Post(
        sse_path_,
        [this](const httplib::Request&, httplib::Response& res)
        {
            res.status = 405;
            res.set_header("Allow", "GET");
            svcagent::Json error_response = {
                {"error", "Method Not Allowed"},
                {"message", "The SSE endpoint only supports GET requests. Use POST on " +
                                message_path_ + "."}};
            res.set_content(error_response.dump(), "application/json");
        });

    svr_->Post(
        message_path_,
        [this](const httplib::Request& req, httplib::Response& res)
        {
            if (!cors_origin_.empty())
                res.set_header("Access-Control-Allow-Origin", cors_origin_);

            if (!req.has_param("session_id"))
            {
                res.status = 400;
                res.set_content("{\"error\":\"session_id parameter required\"}",
                                "application/json");
                return;
            }
            std::string session_id = req.get_param_value("session_id");

            {
                std::lock_guard<std::mutex> lock(conns_mutex_);
                if (connections_.find(session_id) == connections_.end())
                {
                    res.status = 404;
                    res.set_content("{\"error\":\"Invalid or expired session_id\"}",
                                    "application/json");
                    return;
                }
            }

            auto message = util::json::try_parse(req.body);
            if (!message)
            {
                log::warning("rejected non-JSON payload on " + message_path_);
                auto error_response =
                    mcp::make_error_response(svcagent::Json(), mcp::parse_error());
                send_event_to_session(session_id, error_response);
                res.status = 400;
                res.set_content(util::json::dump(error_response), "application/json");
                return;
            }

            svcagent::Json response;
            try
            {
                response = runner_(*message);
            }
            catch (const std::exception& e)
            {
                svcagent::Json id = message->is_object() && message->contains("id")
                                        ? message->at("id")
                                        : svcagent::Json();
                response = mcp::make_error_response(id, mcp::internal_error(e.what()));
            }

            // Deliver on the requesting stream only
            if (!send_event_to_session(session_id, response))
                log::warning("SSE session " + session_id + " closed before its response");

            // Also return in HTTP response for compatibility
            res.set_content(util::json::dump(response), "application/json");
            res.status = 200;
        });

    mount_diagnostics(*svr_, diagnostics_,
                      svcagent::Json{{"sse", sse_path_ + " (GET)"},
                                     {"messages", message_path_ + " (POST)"},
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
    log::info("SSE transport listening on http://" + host_ + ":" + std::to_string(port_) +
              sse_path_);
    return true;
}

void SseServerWrapper::stop()
{
    // Graceful, idempotent shutdown
    running_ = false;
    // Wake any waiting connection queues
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (auto& [session_id, conn] : connections_)
        {
            std::lock_guard<std::mutex> ql(conn->m);
            conn->alive = false;
            conn->cv.notify_all();
        }
    }
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
    {
        thread_.join();
        log::info("SSE transport stopped");
    }
    svr_.reset();
}

} // namespace svcagent::server
