#include "config.hpp"
#include <fstream>
#include <iostream>

namespace toolwire {

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    auto& s = j["server"];
    s["host"] = server.host;
    s["port"] = server.port;
    s["worker_threads"] = server.worker_threads;
    if (server.rate_limit_rpm > 0) s["rate_limit_rpm"] = server.rate_limit_rpm;
    s["session_idle_timeout_s"] = server.session_idle_timeout_s;
    s["name"] = server.name;
    s["version"] = server.version;
    s["builtin_tools"] = server.builtin_tools;

    auto& c = j["client"];
    c["timeout_ms"] = client.timeout_ms;
    c["protocol_version"] = client.protocol_version;
    c["name"] = client.name;
    c["version"] = client.version;

    for (auto& [name, srv] : servers) {
        nlohmann::json u;
        u["url"] = srv.url;
        if (srv.path != "/mcp") u["path"] = srv.path;
        if (!srv.headers.empty()) u["headers"] = srv.headers;
        if (srv.timeout_ms > 0) u["timeout_ms"] = srv.timeout_ms;
        j["servers"][name] = u;
    }
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        c.server.host = s.value("host", c.server.host);
        c.server.port = s.value("port", c.server.port);
        c.server.worker_threads = s.value("worker_threads", c.server.worker_threads);
        c.server.rate_limit_rpm = s.value("rate_limit_rpm", c.server.rate_limit_rpm);
        c.server.session_idle_timeout_s = s.value("session_idle_timeout_s", c.server.session_idle_timeout_s);
        c.server.name = s.value("name", c.server.name);
        c.server.version = s.value("version", c.server.version);
        c.server.builtin_tools = s.value("builtin_tools", c.server.builtin_tools);
    }
    if (c.server.worker_threads < 1) c.server.worker_threads = 1;

    if (j.contains("client") && j["client"].is_object()) {
        auto& cl = j["client"];
        c.client.timeout_ms = cl.value("timeout_ms", c.client.timeout_ms);
        c.client.protocol_version = cl.value("protocol_version", c.client.protocol_version);
        c.client.name = cl.value("name", c.client.name);
        c.client.version = cl.value("version", c.client.version);
    }

    if (j.contains("servers") && j["servers"].is_object()) {
        for (auto& [name, srv] : j["servers"].items()) {
            if (!srv.is_object()) continue;
            UpstreamServerConfig u;
            u.url = srv.value("url", "");
            u.path = srv.value("path", u.path);
            u.timeout_ms = srv.value("timeout_ms", 0);
            if (srv.contains("headers") && srv["headers"].is_object()) {
                for (auto& [hk, hv] : srv["headers"].items()) {
                    if (hv.is_string()) u.headers[hk] = hv.get<std::string>();
                }
            }
            if (u.url.empty()) {
                std::cerr << "[config] Warning: server '" << name << "' has no url, skipped\n";
                continue;
            }
            c.servers[name] = std::move(u);
        }
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace toolwire
