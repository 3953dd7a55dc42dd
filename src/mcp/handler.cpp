#include "svcagent/mcp/handler.hpp"

#include "svcagent/exceptions.hpp"
#include "svcagent/mcp/errors.hpp"
#include "svcagent/util/json.hpp"
#include "svcagent/util/log.hpp"

#include <string>
#include <utility>

namespace svcagent::mcp
{

namespace
{

struct CallEnvelope
{
    svcagent::Json id;
    std::string method;
    svcagent::Json params;
};

CallEnvelope decode_envelope(const svcagent::Json& message)
{
    if (!message.is_object())
        throw svcagent::ParseError("envelope is not a JSON object");

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string())
        throw svcagent::ParseError("envelope has no method");

    CallEnvelope env;
    env.id = message.contains("id") ? message.at("id") : svcagent::Json();
    env.method = method_it->get<std::string>();

    auto params_it = message.find("params");
    if (params_it == message.end() || params_it->is_null())
        env.params = svcagent::Json::object();
    else if (params_it->is_object())
        env.params = *params_it;
    else
        throw svcagent::ParseError("envelope params is not an object");
    return env;
}

// Textual form of the requested tool name for error messages; missing names read "null".
std::string describe_name(const svcagent::Json& name)
{
    if (name.is_string())
        return name.get<std::string>();
    return util::json::dump(name);
}

svcagent::Json make_tool_entry(const tools::Tool& tool)
{
    svcagent::Json schema = tool.input_schema();
    if (schema.is_null())
        schema = svcagent::Json{{"type", "object"}, {"properties", svcagent::Json::object()}};
    return svcagent::Json{
        {"name", tool.name()}, {"description", tool.description()}, {"inputSchema", schema}};
}

svcagent::Json call_tool(const tools::ToolManager& tools, const svcagent::Json& params)
{
    svcagent::Json name = params.contains("name") ? params.at("name") : svcagent::Json();
    if (!name.is_string())
        throw svcagent::ToolNotFoundError(tool_not_found(describe_name(name)).message);

    auto tool = tools.find(name.get<std::string>());
    if (!tool)
        throw svcagent::ToolNotFoundError(tool_not_found(name.get<std::string>()).message);

    svcagent::Json args = params.contains("arguments") ? params.at("arguments")
                                                       : svcagent::Json::object();
    if (args.is_null())
        args = svcagent::Json::object();
    if (!args.is_object())
        throw svcagent::ValidationError(tool->name() +
                                        "() arguments must be a mapping, got " +
                                        std::string(args.type_name()));

    // Whatever the tool raises is a handler defect, whatever its type.
    try
    {
        return build_tool_result(tool->invoke(args));
    }
    catch (const std::exception& e)
    {
        throw svcagent::Error(e.what());
    }
    catch (...)
    {
        throw svcagent::Error("tool '" + tool->name() + "' raised a non-standard exception");
    }
}

} // namespace

svcagent::Json initialize_result(const ServerInfo& info)
{
    svcagent::Json result = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"serverInfo", info},
        {"capabilities", svcagent::Json{{"tools", svcagent::Json{{"listChanged", false}}}}},
    };
    if (info.instructions && !info.instructions->empty())
        result["instructions"] = *info.instructions;
    return result;
}

svcagent::Json tools_list_result(const tools::ToolManager& tools)
{
    svcagent::Json tools_array = svcagent::Json::array();
    for (const auto& tool : tools.list())
        tools_array.push_back(make_tool_entry(tool));
    return svcagent::Json{{"tools", tools_array}};
}

svcagent::Json build_tool_result(const svcagent::Json& result)
{
    std::string text = result.is_string() ? result.get<std::string>() : util::json::dump(result);
    return svcagent::Json{
        {"content", svcagent::Json::array({svcagent::Json{{"type", "text"}, {"text", text}}})}};
}

McpHandler make_mcp_handler(ServerInfo info, std::shared_ptr<const tools::ToolManager> tools)
{
    if (!tools)
        throw svcagent::ValidationError("make_mcp_handler requires a tool registry");

    return [info = std::move(info),
            tools = std::move(tools)](const svcagent::Json& message) -> svcagent::Json
    {
        svcagent::Json id;
        std::string method;
        try
        {
            auto env = decode_envelope(message);
            id = env.id;
            method = env.method;
            log::debug("request " + method + " id=" + util::json::dump(id));

            if (method == "initialize")
                return make_result_response(id, initialize_result(info));

            if (method == "tools/list")
                return make_result_response(id, tools_list_result(*tools));

            if (method == "tools/call")
                return make_result_response(id, call_tool(*tools, env.params));

            throw svcagent::MethodNotFoundError(method_not_found(method).message);
        }
        catch (const std::exception& e)
        {
            auto error = to_rpc_error(e);
            log::warning((method.empty() ? std::string("<undecoded>") : method) + " failed (" +
                         std::to_string(to_int(error.code)) + "): " + error.message);
            // Parse failures never carry an id.
            if (error.code == ErrorCode::ParseError)
                return make_error_response(svcagent::Json(), error);
            return make_error_response(id, error);
        }
    };
}

} // namespace svcagent::mcp
