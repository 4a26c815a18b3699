#include "tool_client.hpp"
#include <iostream>

namespace toolwire {

ToolClient::ToolClient(Transport& transport, ClientOptions opts)
    : transport_(transport), opts_(std::move(opts)), session_(nlohmann::json::object()) {}

ToolClient::~ToolClient() {
    close();
}

nlohmann::json ToolClient::request(const std::string& method, nlohmann::json params) {
    if (method != "initialize") session_.require_initialized();

    Envelope req = Envelope::request(session_.next_request_id(), method, std::move(params));
    Envelope resp = transport_.send(req, opts_.timeout);
    if (resp.error) {
        throw ProtocolError(resp.error->code, resp.error->message, resp.error->data);
    }
    return *resp.result;
}

nlohmann::json ToolClient::initialize() {
    auto result = request("initialize", {
        {"protocolVersion", opts_.protocol_version},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", opts_.name}, {"version", opts_.version}}}
    });
    session_.establish(result);
    transport_.notify(Envelope::notification("notifications/initialized"), opts_.timeout);
    return result;
}

std::vector<ToolDescriptor> ToolClient::list_tools() {
    std::vector<ToolDescriptor> tools;

    auto result = request("tools/list", nlohmann::json::object());
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        throw TransportError(TransportError::Kind::malformed, "tools/list result has no tools array");
    }

    for (auto& t : result["tools"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) continue;
        tools.push_back(ToolDescriptor::from_json(t));
    }
    return tools;
}

InvocationResult ToolClient::call_tool(const std::string& tool_name, const nlohmann::json& args) {
    auto result = request("tools/call", {
        {"name", tool_name},
        {"arguments", args.is_null() ? nlohmann::json::object() : args}
    });
    return InvocationResult::from_json(result);
}

void ToolClient::ping() {
    request("ping", nlohmann::json::object());
}

void ToolClient::close() {
    if (session_.closed()) return;
    bool was_open = session_.initialized();
    session_.close();
    if (was_open) transport_.close();
}

} // namespace toolwire
