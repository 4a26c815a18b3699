#pragma once
#include "envelope.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace toolwire {

struct ServerInfo {
    std::string name = "toolwire";
    std::string version = "1.0.0";
};

nlohmann::json server_capabilities();

// Routes decoded requests to initialize / tools/list / tools/call. Holds no
// mutable state, so any number of threads may dispatch at once.
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& tools, ServerInfo info = {})
        : tools_(tools), info_(std::move(info)) {}

    // Always yields a response carrying request.id. Never throws.
    Envelope dispatch(const Envelope& request, Session& session) const;

    // Requests without an id. Nothing is sent back.
    void notify(const Envelope& notification, Session& session) const;

    const ServerInfo& info() const { return info_; }
    const ToolRegistry& tools() const { return tools_; }

private:
    const ToolRegistry& tools_;
    ServerInfo info_;

    Envelope handle_initialize(const Envelope& req, Session& session) const;
    Envelope handle_tools_list(const Envelope& req) const;
    Envelope handle_tools_call(const Envelope& req) const;
};

} // namespace toolwire
