#pragma once
#include "config.hpp"
#include "http_client.hpp"
#include "tool_adapter.hpp"
#include "tool_client.hpp"
#include "tool_registry.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolwire {

// The tools of several upstream servers, re-exported under
// "<server>_<tool>" names into a local registry.
class Toolbox {
public:
    Toolbox(const std::map<std::string, UpstreamServerConfig>& servers, const ClientConfig& client);
    ~Toolbox();

    // Initializes and discovers every server; failures are logged and skipped.
    void connect_all();
    void disconnect_all();

    void register_tools(ToolRegistry& reg);

    size_t server_count() const { return upstreams_.size(); }
    size_t connected_count() const;
    const ToolAdapter* adapter(const std::string& server) const;

private:
    struct Upstream {
        std::unique_ptr<HttpTransport> transport;
        std::unique_ptr<ToolClient> client;
        std::unique_ptr<ToolAdapter> adapter;
        bool connected = false;
    };
    std::map<std::string, Upstream> upstreams_;
};

} // namespace toolwire
