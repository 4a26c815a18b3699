#pragma once
#include "http_client.hpp"
#include "invocation.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolwire {

struct ClientOptions {
    std::string name = "toolwire-client";
    std::string version = "1.0.0";
    std::string protocol_version = "2025-06-18";
    std::chrono::milliseconds timeout{30000};
};

// Speaks the protocol over a Transport. Protocol errors surface as
// ProtocolError, transport failures as TransportError; tool-level failures
// come back as InvocationResult data.
class ToolClient {
public:
    explicit ToolClient(Transport& transport, ClientOptions opts = {});
    ~ToolClient();

    ToolClient(const ToolClient&) = delete;
    ToolClient& operator=(const ToolClient&) = delete;

    // Returns the server's initialize result.
    nlohmann::json initialize();
    std::vector<ToolDescriptor> list_tools();
    InvocationResult call_tool(const std::string& tool_name, const nlohmann::json& args);
    void ping();
    void close();

    Session& session() { return session_; }
    const ClientOptions& options() const { return opts_; }

private:
    Transport& transport_;
    ClientOptions opts_;
    Session session_;

    nlohmann::json request(const std::string& method, nlohmann::json params);
};

} // namespace toolwire
