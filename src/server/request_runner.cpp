#include "svcagent/server/request_runner.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/mcp/errors.hpp"
#include "svcagent/util/log.hpp"

#include <future>
#include <memory>
#include <string>
#include <thread>

namespace svcagent::server
{

namespace
{
svcagent::Json request_id(const svcagent::Json& request)
{
    if (request.is_object() && request.contains("id"))
        return request.at("id");
    return svcagent::Json();
}
} // namespace

RequestRunner::RequestRunner(mcp::McpHandler handler, std::chrono::milliseconds timeout,
                             std::size_t max_in_flight)
    : handler_(std::move(handler)), timeout_(timeout), max_in_flight_(max_in_flight),
      in_flight_(std::make_shared<std::atomic<std::size_t>>(0))
{
    if (!handler_)
        throw svcagent::ValidationError("RequestRunner requires a handler");
    if (timeout_.count() < 0)
        throw svcagent::ValidationError("RequestRunner timeout must be >= 0");
    if (max_in_flight_ == 0)
        throw svcagent::ValidationError("RequestRunner max_in_flight must be >= 1");
}

svcagent::Json RequestRunner::run_inline(const svcagent::Json& request) const
{
    try
    {
        return handler_(request);
    }
    catch (const std::exception& e)
    {
        return mcp::make_error_response(request_id(request), mcp::to_rpc_error(e));
    }
    catch (...)
    {
        return mcp::make_error_response(request_id(request),
                                        mcp::internal_error("handler raised a non-standard exception"));
    }
}

svcagent::Json RequestRunner::operator()(const svcagent::Json& request) const
{
    if (timeout_.count() == 0)
        return run_inline(request);

    if (in_flight_->fetch_add(1) >= max_in_flight_)
    {
        in_flight_->fetch_sub(1);
        std::string message =
            "Server busy: " + std::to_string(max_in_flight_) + " requests already in flight";
        log::warning(message);
        return mcp::make_error_response(request_id(request), mcp::internal_error(message));
    }

    auto promise = std::make_shared<std::promise<svcagent::Json>>();
    auto future = promise->get_future();

    // The worker owns copies of everything it touches so it may outlive this call.
    std::thread(
        [handler = handler_, promise, request, in_flight = in_flight_]()
        {
            try
            {
                promise->set_value(handler(request));
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
            in_flight->fetch_sub(1);
        })
        .detach();

    if (future.wait_for(timeout_) != std::future_status::ready)
    {
        std::string message = "Request timed out after " + std::to_string(timeout_.count()) + " ms";
        log::warning(message);
        return mcp::make_error_response(request_id(request), mcp::internal_error(message));
    }

    try
    {
        return future.get();
    }
    catch (const std::exception& e)
    {
        return mcp::make_error_response(request_id(request), mcp::to_rpc_error(e));
    }
    catch (...)
    {
        return mcp::make_error_response(request_id(request),
                                        mcp::internal_error("handler raised a non-standard exception"));
    }
}

} // namespace svcagent::server
