#include "svcagent/mcp/errors.hpp"

#include "svcagent/exceptions.hpp"

namespace svcagent::mcp
{

RpcError parse_error()
{
    return RpcError{ErrorCode::ParseError, "Parse error"};
}

RpcError method_not_found(const std::string& method)
{
    return RpcError{ErrorCode::MethodNotFound, "Method not found: " + method};
}

RpcError tool_not_found(const std::string& tool_name)
{
    return RpcError{ErrorCode::MethodNotFound, "Tool not found: " + tool_name};
}

RpcError internal_error(const std::string& what)
{
    return RpcError{ErrorCode::InternalError, what};
}

RpcError to_rpc_error(const std::exception& e)
{
    if (dynamic_cast<const svcagent::ParseError*>(&e))
        return parse_error();
    if (dynamic_cast<const svcagent::NotFoundError*>(&e))
        return RpcError{ErrorCode::MethodNotFound, e.what()};
    return internal_error(e.what());
}

svcagent::Json make_error_response(const svcagent::Json& id, const RpcError& error)
{
    return svcagent::Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
}

svcagent::Json make_result_response(const svcagent::Json& id, svcagent::Json result)
{
    return svcagent::Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

} // namespace svcagent::mcp
