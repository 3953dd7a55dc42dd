#pragma once
#include "svcagent/mcp/handler.hpp"
#include "svcagent/server/diagnostics.hpp"
#include "svcagent/server/request_runner.hpp"
#include "svcagent/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace httplib
{
class Server;
class DataSink;
} // namespace httplib

namespace svcagent::server
{

/**
 * SSE (Server-Sent Events) streaming binding.
 *
 * - GET sse_path: opens a long-lived event stream for one client. The first event
 *   ("endpoint") carries the message URL including the session id assigned to the stream.
 * - POST message_path?session_id=...: receives one JSON-RPC envelope. The response envelope
 *   is pushed onto that session's stream as an "event: message" and also returned in the
 *   HTTP body for clients that do not read the stream.
 *
 * Bodies that are not JSON are rejected with status 400 and a Parse Error envelope (id null)
 * before reaching the handler. GET /health, GET /tools and GET / are served as well.
 *
 * Usage:
 *   auto handler = svcagent::mcp::make_mcp_handler(info, tools);
 *   SseServerWrapper server(handler, Diagnostics{info, tools});
 *   server.start();  // Non-blocking - runs in background thread
 *   // ... server runs ...
 *   server.stop();   // Graceful shutdown
 */
class SseServerWrapper
{
  public:
    /**
     * @param handler Function that processes JSON-RPC requests and returns responses
     * @param diagnostics Identity and registry shown on the diagnostics endpoints
     * @param host Host address to bind to (default: "127.0.0.1")
     * @param port Port to listen on (default: 8000)
     * @param request_timeout Per-request handler timeout, 0 disables
     * @param sse_path Path for SSE GET endpoint (default: "/sse")
     * @param message_path Path for POST message endpoint (default: "/messages")
     * @param cors_origin Optional CORS origin to allow (empty = no CORS header)
     */
    SseServerWrapper(mcp::McpHandler handler, Diagnostics diagnostics,
                     std::string host = "127.0.0.1", int port = 8000,
                     std::chrono::milliseconds request_timeout = std::chrono::milliseconds(30000),
                     std::string sse_path = "/sse", std::string message_path = "/messages",
                     std::string cors_origin = "");

    ~SseServerWrapper();

    /**
     * Start the server in background (non-blocking).
     *
     * @return true if the port was bound and the server thread launched
     */
    bool start();

    /**
     * Stop the server. Closes every open stream and joins the background thread.
     * Safe to call multiple times.
     */
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

    const std::string& sse_path() const
    {
        return sse_path_;
    }

    const std::string& message_path() const
    {
        return message_path_;
    }

    /// Number of currently open event streams.
    std::size_t session_count() const;

  private:
    struct ConnectionState
    {
        std::string session_id;
        std::deque<svcagent::Json> queue;
        std::mutex m;
        std::condition_variable cv;
        std::atomic<bool> alive{true};
    };

    void handle_sse_connection(httplib::DataSink& sink, std::shared_ptr<ConnectionState> conn,
                               const std::string& session_id);
    bool send_event_to_session(const std::string& session_id, const svcagent::Json& event);
    std::string generate_session_id();

    RequestRunner runner_;
    Diagnostics diagnostics_;
    std::string host_;
    int port_;
    std::string sse_path_;
    std::string message_path_;
    std::string cors_origin_; // Optional CORS origin (empty = no CORS)

    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    // Security limits
    static constexpr size_t MAX_CONNECTIONS = 100;
    static constexpr size_t MAX_QUEUE_SIZE = 1000;

    // Active SSE connections mapped by session ID
    std::unordered_map<std::string, std::shared_ptr<ConnectionState>> connections_;
    mutable std::mutex conns_mutex_;
};

} // namespace svcagent::server
