/// @file test_error_codes.cpp
/// @brief Mapping of failures to JSON-RPC error codes

#include "svcagent/exceptions.hpp"
#include "svcagent/mcp/errors.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

using namespace svcagent;

int main()
{
    // Wire values
    assert(mcp::to_int(mcp::ErrorCode::ParseError) == -32700);
    assert(mcp::to_int(mcp::ErrorCode::MethodNotFound) == -32601);
    assert(mcp::to_int(mcp::ErrorCode::InternalError) == -32603);

    // Factories
    assert(mcp::parse_error().message == "Parse error");
    assert(mcp::method_not_found("foo/bar").message == "Method not found: foo/bar");
    assert(mcp::tool_not_found("missing").code == mcp::ErrorCode::MethodNotFound);
    assert(mcp::tool_not_found("missing").message == "Tool not found: missing");

    // Exception kinds
    {
        auto e = mcp::to_rpc_error(ParseError("bad json"));
        assert(e.code == mcp::ErrorCode::ParseError);
        assert(e.message == "Parse error");
    }
    {
        auto e = mcp::to_rpc_error(MethodNotFoundError("Method not found: x"));
        assert(e.code == mcp::ErrorCode::MethodNotFound);
        assert(e.message == "Method not found: x");
    }
    {
        auto e = mcp::to_rpc_error(ToolNotFoundError("Tool not found: y"));
        assert(e.code == mcp::ErrorCode::MethodNotFound);
        assert(e.message == "Tool not found: y");
    }
    {
        auto e = mcp::to_rpc_error(ValidationError("arguments must be a mapping"));
        assert(e.code == mcp::ErrorCode::InternalError);
        assert(e.message == "arguments must be a mapping");
    }
    {
        auto e = mcp::to_rpc_error(std::runtime_error("disk on fire"));
        assert(e.code == mcp::ErrorCode::InternalError);
        assert(e.message == "disk on fire");
    }

    // Envelopes
    {
        auto resp = mcp::make_error_response(Json(), mcp::parse_error());
        assert(resp["jsonrpc"] == "2.0");
        assert(resp["id"].is_null());
        assert(resp["error"]["code"] == -32700);
        assert(resp["error"]["message"] == "Parse error");
        assert(!resp.contains("result"));
    }
    {
        auto resp = mcp::make_result_response("abc", Json{{"tools", Json::array()}});
        assert(resp["jsonrpc"] == "2.0");
        assert(resp["id"] == "abc");
        assert(resp["result"]["tools"].is_array());
        assert(!resp.contains("error"));
    }

    return 0;
}
