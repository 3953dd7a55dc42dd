/// @file request_timeout.cpp
/// @brief Per-request timeout and exception mapping in RequestRunner

#include "svcagent/exceptions.hpp"
#include "svcagent/server/request_runner.hpp"

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace svcagent;

int main()
{
    using namespace std::chrono_literals;

    auto handler = [](const Json& request) -> Json
    {
        std::string method = request.value("method", "");
        if (method == "slow")
            std::this_thread::sleep_for(500ms);
        if (method == "throw")
            throw std::runtime_error("handler exploded");
        return Json{{"jsonrpc", "2.0"}, {"id", request.value("id", Json())}, {"result", method}};
    };

    // Fast requests pass straight through
    {
        server::RequestRunner runner(handler, 200ms);
        auto resp = runner(Json{{"id", 1}, {"method", "fast"}});
        assert(resp["result"] == "fast");
    }

    // Overrunning requests get -32603 with the id echoed
    {
        server::RequestRunner runner(handler, 50ms);
        auto start = std::chrono::steady_clock::now();
        auto resp = runner(Json{{"id", 2}, {"method", "slow"}});
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(elapsed < 400ms);
        assert(resp["jsonrpc"] == "2.0");
        assert(resp["id"] == 2);
        assert(resp["error"]["code"] == -32603);
        assert(resp["error"]["message"].get<std::string>().find("timed out") != std::string::npos);

        // The runner keeps serving after a timeout
        auto next = runner(Json{{"id", 3}, {"method", "fast"}});
        assert(next["result"] == "fast");
    }

    // Abandoned workers count against the in-flight limit until they finish
    {
        server::RequestRunner runner(handler, 50ms, 1);
        auto slow = runner(Json{{"id", 6}, {"method", "slow"}});
        assert(slow["error"]["code"] == -32603);
        assert(runner.in_flight() == 1);

        auto busy = runner(Json{{"id", 7}, {"method", "fast"}});
        assert(busy["id"] == 7);
        assert(busy["error"]["code"] == -32603);
        assert(busy["error"]["message"].get<std::string>().find("busy") != std::string::npos);

        for (int i = 0; i < 100 && runner.in_flight() > 0; ++i)
            std::this_thread::sleep_for(20ms);
        assert(runner.in_flight() == 0);
        auto after = runner(Json{{"id", 8}, {"method", "fast"}});
        assert(after["result"] == "fast");
    }

    // Escaping exceptions are mapped, with and without a timeout
    for (auto timeout : {0ms, 200ms})
    {
        server::RequestRunner runner(handler, timeout);
        auto resp = runner(Json{{"id", 4}, {"method", "throw"}});
        assert(resp["id"] == 4);
        assert(resp["error"]["code"] == -32603);
        assert(resp["error"]["message"] == "handler exploded");
    }

    // Timeout 0 runs inline and never times out
    {
        server::RequestRunner runner(handler, 0ms);
        auto resp = runner(Json{{"id", 5}, {"method", "slow"}});
        assert(resp["result"] == "slow");
    }

    // Construction is validated
    bool threw = false;
    try
    {
        server::RequestRunner runner(nullptr);
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        server::RequestRunner runner(handler, -1ms);
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        server::RequestRunner runner(handler, 50ms, 0);
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    // Let the abandoned slow worker finish before exit
    std::this_thread::sleep_for(600ms);
    return 0;
}
