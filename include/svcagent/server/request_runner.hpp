#pragma once
#include "svcagent/mcp/handler.hpp"
#include "svcagent/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

namespace svcagent::server
{

/**
 * Runs the protocol handler for one decoded request on behalf of a transport.
 *
 * With a non-zero timeout the handler executes on its own thread and the caller waits at
 * most that long. A request that overruns is answered with an Internal Error envelope
 * (-32603) echoing the request id; the handler itself is not cancelled and its late result
 * is dropped. Exceptions that escape the handler are mapped through the error mapper, so
 * operator() always returns a well-formed response envelope.
 *
 * At most max_in_flight workers exist at once, counting abandoned ones that are still
 * running; further requests are refused with -32603 until one finishes. A worker owns
 * copies of the handler and the request and may outlive the runner, so handlers must not
 * touch state that is destroyed before they return.
 */
class RequestRunner
{
  public:
    explicit RequestRunner(mcp::McpHandler handler,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
                           std::size_t max_in_flight = 64);

    svcagent::Json operator()(const svcagent::Json& request) const;

    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

    /// Worker threads currently running, including ones whose caller has timed out.
    std::size_t in_flight() const
    {
        return in_flight_->load();
    }

  private:
    svcagent::Json run_inline(const svcagent::Json& request) const;

    mcp::McpHandler handler_;
    std::chrono::milliseconds timeout_;
    std::size_t max_in_flight_;
    std::shared_ptr<std::atomic<std::size_t>> in_flight_;
};

} // namespace svcagent::server
