#include "svcagent/exceptions.hpp"
#include "svcagent/mcp/handler.hpp"
#include "svcagent/server/http_server.hpp"
#include "svcagent/server/sse_server.hpp"
#include "svcagent/services/catalog.hpp"
#include "svcagent/settings.hpp"
#include "svcagent/util/json.hpp"
#include "svcagent/util/log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int)
{
    g_running = false;
}

int usage(int exit_code = 1)
{
    svcagent::ServerInfo info;
    std::cout << "svcagent " << info.version << "\n";
    std::cout << "Usage:\n";
    std::cout << "  svcagent --help\n";
    std::cout << "  svcagent serve [options]\n";
    std::cout << "  svcagent tools\n";
    std::cout << "  svcagent call <tool> [json-arguments]\n";
    std::cout << "\n";
    std::cout << "Serve options:\n";
    std::cout << "  --transport <http|sse>   Binding to run (default: http)\n";
    std::cout << "  --host <addr>            Bind address (default: 0.0.0.0)\n";
    std::cout << "  --port <n>               Listen port (default: 8000)\n";
    std::cout << "  --config <file>          JSON settings file\n";
    std::cout << "  --log-level <level>      debug, info, warning, error, off\n";
    std::cout << "  --timeout-ms <n>         Per-request timeout, 0 disables (default: 30000)\n";
    std::cout << "\n";
    std::cout << "Environment: SVCAGENT_HOST, SVCAGENT_PORT, SVCAGENT_TRANSPORT,\n";
    std::cout << "  SVCAGENT_LOG_LEVEL, SVCAGENT_REQUEST_TIMEOUT_MS, SVCAGENT_CORS_ORIGIN,\n";
    std::cout << "  SVCAGENT_CONVERSATIONS_DIR, SVCAGENT_INSTRUCTIONS\n";
    return exit_code;
}

std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                              const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] != flag)
            continue;
        if (i + 1 >= args.size())
            throw svcagent::ConfigError("missing value for " + flag);
        std::string value = args[i + 1];
        args.erase(args.begin() + static_cast<long long>(i),
                   args.begin() + static_cast<long long>(i) + 2);
        return value;
    }
    return std::nullopt;
}

int parse_int_flag(const std::string& flag, const std::string& value)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(value, &pos, 10);
        if (pos == value.size())
            return v;
    }
    catch (const std::logic_error&)
    {
        // fall through to the error below
    }
    throw svcagent::ConfigError(flag + " expects an integer, got '" + value + "'");
}

/// defaults < environment < config file < command-line flags
svcagent::Settings resolve_settings(std::vector<std::string>& args)
{
    auto settings = svcagent::Settings::from_env();
    if (auto path = consume_flag_value(args, "--config"))
        settings.merge_file(*path);
    if (auto v = consume_flag_value(args, "--transport"))
        settings.transport = *v;
    if (auto v = consume_flag_value(args, "--host"))
        settings.host = *v;
    if (auto v = consume_flag_value(args, "--port"))
        settings.port = parse_int_flag("--port", *v);
    if (auto v = consume_flag_value(args, "--log-level"))
        settings.log_level = *v;
    if (auto v = consume_flag_value(args, "--timeout-ms"))
        settings.request_timeout_ms = parse_int_flag("--timeout-ms", *v);

    if (!args.empty())
        throw svcagent::ConfigError("unknown option: " + args.front());

    settings.validate();
    return settings;
}

struct Composition
{
    svcagent::ServerInfo info;
    std::shared_ptr<svcagent::tools::ToolManager> tools;
    svcagent::mcp::McpHandler handler;
};

Composition compose(const svcagent::Settings& settings)
{
    Composition c;
    if (!settings.instructions.empty())
        c.info.instructions = settings.instructions;
    c.tools = std::make_shared<svcagent::tools::ToolManager>();

    svcagent::services::ServiceOptions options;
    options.conversations_dir = settings.conversations_dir;
    svcagent::services::register_service_tools(*c.tools, options);

    c.handler = svcagent::mcp::make_mcp_handler(c.info, c.tools);
    return c;
}

template <typename Wrapper>
int serve_until_signalled(Wrapper& server, const std::string& what)
{
    if (!server.start())
    {
        svcagent::log::error("failed to bind " + server.host() + ":" +
                             std::to_string(server.port()));
        return 1;
    }
    svcagent::log::info(what + " listening on " + server.host() + ":" +
                        std::to_string(server.port()));

    while (g_running && server.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    svcagent::log::info("shutting down");
    server.stop();
    return 0;
}

int run_serve(std::vector<std::string> args)
{
    auto settings = resolve_settings(args);
    svcagent::log::set_level(svcagent::log::parse_level(settings.log_level));

    auto c = compose(settings);
    svcagent::server::Diagnostics diagnostics{c.info, c.tools};
    auto timeout = std::chrono::milliseconds(settings.request_timeout_ms);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (settings.transport == "sse")
    {
        svcagent::server::SseServerWrapper server(c.handler, diagnostics, settings.host,
                                                  settings.port, timeout, "/sse", "/messages",
                                                  settings.cors_origin);
        return serve_until_signalled(server, "SSE transport");
    }

    svcagent::server::HttpServerWrapper server(c.handler, diagnostics, settings.host,
                                               settings.port, timeout, settings.cors_origin);
    return serve_until_signalled(server, "HTTP transport");
}

int run_tools()
{
    auto settings = svcagent::Settings::from_env();
    svcagent::log::set_level(svcagent::log::Level::Warning);
    auto c = compose(settings);
    std::cout << svcagent::util::json::dump_pretty(svcagent::mcp::tools_list_result(*c.tools))
              << "\n";
    return 0;
}

int run_call(const std::string& tool, const std::string& raw_arguments)
{
    auto arguments = svcagent::util::json::try_parse(raw_arguments);
    if (!arguments)
    {
        std::cerr << "Error: arguments are not valid JSON\n";
        return 2;
    }

    auto settings = svcagent::Settings::from_env();
    svcagent::log::set_level(svcagent::log::Level::Warning);
    auto c = compose(settings);

    svcagent::Json request = {{"jsonrpc", "2.0"},
                              {"id", 1},
                              {"method", "tools/call"},
                              {"params", {{"name", tool}, {"arguments", *arguments}}}};
    auto response = c.handler(request);
    std::cout << svcagent::util::json::dump_pretty(response) << "\n";
    return response.contains("error") ? 1 : 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);

    try
    {
        if (cmd == "serve")
            return run_serve(std::vector<std::string>(argv + 2, argv + argc));

        if (cmd == "tools")
            return run_tools();

        if (cmd == "call")
        {
            if (argc < 3 || argc > 4)
                return usage();
            return run_call(argv[2], argc == 4 ? argv[3] : "{}");
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return usage();
}
