#include "serve.hpp"
#include "dispatcher.hpp"
#include "http_server.hpp"
#include "tool_registry.hpp"
#include "toolbox.hpp"
#include "tools/calculator_tools.hpp"
#include "tools/greeting_tools.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace toolwire {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static Config resolve_config(const ServeOptions& opts) {
    Config cfg = Config::load(opts.config_path.empty() ? default_config_path()
                                                       : expand_path(opts.config_path));
    if (!opts.host.empty()) cfg.server.host = opts.host;
    if (opts.port > 0) cfg.server.port = opts.port;
    if (opts.no_builtin) cfg.server.builtin_tools = false;
    return cfg;
}

static int run_server(const ServerConfig& cfg, const ToolRegistry& tools) {
    Dispatcher dispatcher(tools, ServerInfo{cfg.name, cfg.version});
    HttpServer server(dispatcher, cfg);
    if (!server.start()) return 1;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cerr << "[serve] " << cfg.name << " ready with " << tools.size() << " tools at http://"
              << cfg.host << ":" << server.port() << "/mcp. Ctrl+C to quit.\n";

    while (g_running && server.running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[serve] Shutting down...\n";
    server.stop();
    std::cerr << "[serve] Done.\n";
    return 0;
}

int cmd_serve(const ServeOptions& opts) {
    Config cfg = resolve_config(opts);

    ToolRegistry tools;
    if (cfg.server.builtin_tools) {
        register_calculator_tools(tools);
        register_greeting_tools(tools, cfg.server.name);
    }
    if (tools.size() == 0) {
        std::cerr << "[warn] No tools registered. Server will still answer initialize and tools/list.\n";
    }
    return run_server(cfg.server, tools);
}

int cmd_gateway(const ServeOptions& opts) {
    Config cfg = resolve_config(opts);
    if (cfg.servers.empty()) {
        std::cerr << "[gateway] No upstream servers configured under \"servers\"\n";
        return 1;
    }

    ToolRegistry tools;
    Toolbox toolbox(cfg.servers, cfg.client);
    toolbox.connect_all();
    if (toolbox.connected_count() == 0) {
        std::cerr << "[gateway] No upstream server reachable\n";
        return 1;
    }
    try {
        if (cfg.server.builtin_tools) {
            register_calculator_tools(tools);
            register_greeting_tools(tools, cfg.server.name);
        }
        toolbox.register_tools(tools);
    } catch (const RegistryError& e) {
        std::cerr << "[gateway] " << e.what() << "\n";
        return 1;
    }

    int rc = run_server(cfg.server, tools);
    toolbox.disconnect_all();
    return rc;
}

} // namespace toolwire
