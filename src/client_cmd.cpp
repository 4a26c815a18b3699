#include "client_cmd.hpp"
#include "http_client.hpp"
#include "tool_adapter.hpp"
#include "tool_client.hpp"
#include <iostream>

namespace toolwire {

static ClientOptions client_options(const ClientCommandOptions& opts) {
    ClientOptions co;
    co.timeout = std::chrono::milliseconds(opts.timeout_ms);
    return co;
}

// Exit codes: 0 ok, 1 usage, 2 protocol error, 3 transport error, 4 tool failure.
static int report(const std::exception& e) {
    if (auto* pe = dynamic_cast<const ProtocolError*>(&e)) {
        std::cerr << "[protocol error " << pe->code() << "] " << pe->what() << "\n";
        return 2;
    }
    if (auto* te = dynamic_cast<const TransportError*>(&e)) {
        std::cerr << "[transport " << transport_error_name(te->kind()) << "] " << te->what() << "\n";
        return 3;
    }
    std::cerr << "[error] " << e.what() << "\n";
    return 1;
}

int cmd_tools(const ClientCommandOptions& opts) {
    HttpTransport transport(opts.url, opts.path);
    ToolClient client(transport, client_options(opts));
    try {
        client.initialize();
        ToolAdapter adapter(client);
        adapter.discover();

        auto server = client.session().peer_info();
        auto field = [&server](const char* key, const char* fallback) {
            return server.contains(key) && server[key].is_string() ? server[key].get<std::string>()
                                                                   : std::string(fallback);
        };
        std::cout << field("name", "?") << " " << field("version", "")
                  << " (protocol " << client.session().protocol_version() << ")\n";
        for (auto& tool : adapter.tools()) {
            std::cout << "  " << tool.name() << " - " << tool.description() << "\n";
            for (auto& f : tool.schema().fields()) {
                std::cout << "      " << f.name << ": " << field_type_name(f.type)
                          << (f.required ? " (required)" : "");
                if (!f.description.empty()) std::cout << "  " << f.description;
                std::cout << "\n";
            }
        }
    } catch (const std::exception& e) {
        return report(e);
    }
    return 0;
}

int cmd_call(const ClientCommandOptions& opts, const std::string& tool, const std::string& args_json) {
    nlohmann::json args;
    try {
        args = args_json.empty() ? nlohmann::json::object() : nlohmann::json::parse(args_json);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[error] arguments are not valid JSON: " << e.what() << "\n";
        return 1;
    }

    HttpTransport transport(opts.url, opts.path);
    ToolClient client(transport, client_options(opts));
    try {
        client.initialize();
        ToolAdapter adapter(client);
        adapter.discover();
        InvocationResult result = adapter.invoke(tool, args);
        if (result.is_error()) {
            std::cerr << "[tool failure] " << result.text() << "\n";
            return 4;
        }
        std::cout << result.text() << "\n";
    } catch (const std::exception& e) {
        return report(e);
    }
    return 0;
}

} // namespace toolwire
