#include "toolbox.hpp"
#include <iostream>

namespace toolwire {

Toolbox::Toolbox(const std::map<std::string, UpstreamServerConfig>& servers, const ClientConfig& client) {
    for (auto& [name, cfg] : servers) {
        ClientOptions opts;
        opts.name = client.name;
        opts.version = client.version;
        opts.protocol_version = client.protocol_version;
        opts.timeout = std::chrono::milliseconds(cfg.timeout_ms > 0 ? cfg.timeout_ms : client.timeout_ms);

        Upstream up;
        up.transport = std::make_unique<HttpTransport>(cfg.url, cfg.path, cfg.headers);
        up.client = std::make_unique<ToolClient>(*up.transport, opts);
        up.adapter = std::make_unique<ToolAdapter>(*up.client);
        upstreams_.emplace(name, std::move(up));
    }
}

Toolbox::~Toolbox() { disconnect_all(); }

void Toolbox::connect_all() {
    for (auto& [name, up] : upstreams_) {
        if (up.connected) continue;
        try {
            up.client->initialize();
            up.adapter->discover();
            up.connected = true;
            auto peer = up.client->session().peer_info();
            std::string server = peer.contains("name") && peer["name"].is_string()
                                     ? peer["name"].get<std::string>() : "?";
            std::cerr << "[toolbox] Connected to " << name << " (" << server << ", "
                      << up.adapter->tools().size() << " tools)\n";
        } catch (const std::exception& e) {
            std::cerr << "[toolbox] Failed to connect to " << name << ": " << e.what() << "\n";
        }
    }
}

void Toolbox::disconnect_all() {
    for (auto& [name, up] : upstreams_) {
        if (!up.connected) continue;
        up.client->close();
        up.connected = false;
        std::cerr << "[toolbox] Disconnected from " << name << "\n";
    }
}

void Toolbox::register_tools(ToolRegistry& reg) {
    for (auto& [server_name, up] : upstreams_) {
        if (!up.connected) continue;

        for (auto& tool : up.adapter->tools()) {
            ToolDescriptor d = tool.descriptor();
            d.name = server_name + "_" + tool.name();
            d.description = "[" + server_name + "] " + tool.description();

            // Upstream protocol or transport trouble is a failure of this
            // tool, not of the caller's request.
            const RemoteTool* remote = &tool;
            std::string prefixed = d.name;
            reg.register_tool(std::move(d), [remote](const nlohmann::json& args) {
                return (*remote)(args);
            });
            std::cerr << "[toolbox] Registered tool: " << prefixed << "\n";
        }
    }
}

size_t Toolbox::connected_count() const {
    size_t n = 0;
    for (auto& [_, up] : upstreams_) if (up.connected) n++;
    return n;
}

const ToolAdapter* Toolbox::adapter(const std::string& server) const {
    auto it = upstreams_.find(server);
    if (it == upstreams_.end() || !it->second.connected) return nullptr;
    return it->second.adapter.get();
}

} // namespace toolwire
