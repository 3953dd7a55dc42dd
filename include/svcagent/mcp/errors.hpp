#pragma once
#include "svcagent/types.hpp"

#include <exception>
#include <string>

namespace svcagent::mcp
{

/// JSON-RPC error codes used on the wire. Values are part of the client contract.
enum class ErrorCode : int
{
    ParseError = -32700,
    MethodNotFound = -32601,
    InternalError = -32603
};

struct RpcError
{
    ErrorCode code{ErrorCode::InternalError};
    std::string message;
};

RpcError parse_error();
RpcError method_not_found(const std::string& method);
RpcError tool_not_found(const std::string& tool_name);
RpcError internal_error(const std::string& what);

/// ParseError -> -32700, MethodNotFoundError / ToolNotFoundError -> -32601 (message kept
/// verbatim), anything else -> -32603 carrying what().
RpcError to_rpc_error(const std::exception& e);

svcagent::Json make_error_response(const svcagent::Json& id, const RpcError& error);
svcagent::Json make_result_response(const svcagent::Json& id, svcagent::Json result);

inline int to_int(ErrorCode code)
{
    return static_cast<int>(code);
}

inline void to_json(svcagent::Json& j, const RpcError& e)
{
    j = svcagent::Json{{"code", to_int(e.code)}, {"message", e.message}};
}

} // namespace svcagent::mcp
