#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace toolwire {

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 8001;
    int worker_threads = 8;
    int rate_limit_rpm = 0;    // 0 = unlimited
    int session_idle_timeout_s = 1800; // 0 = sessions live until DELETE
    std::string name = "toolwire";
    std::string version = "1.0.0";
    bool builtin_tools = true; // calculator + greeting providers
};

struct ClientConfig {
    int timeout_ms = 30000;
    std::string protocol_version = "2025-06-18";
    std::string name = "toolwire-client";
    std::string version = "1.0.0";
};

// An upstream tool server the gateway connects to.
struct UpstreamServerConfig {
    std::string url;             // e.g. http://localhost:8001
    std::string path = "/mcp";
    std::map<std::string, std::string> headers;
    int timeout_ms = 0;          // 0 = use client.timeout_ms
};

struct Config {
    ServerConfig server;
    ClientConfig client;
    std::map<std::string, UpstreamServerConfig> servers;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace toolwire
