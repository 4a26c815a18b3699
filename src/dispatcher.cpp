#include "dispatcher.hpp"
#include <iostream>

namespace toolwire {

nlohmann::json server_capabilities() {
    return {{"tools", {{"listChanged", false}}}};
}

Envelope Dispatcher::dispatch(const Envelope& req, Session& session) const {
    try {
        if (req.method == "initialize") return handle_initialize(req, session);
        if (req.method == "ping") {
            if (session.closed()) throw SessionError(SessionError::Kind::closed, "session is closed");
            return Envelope::success(req.id, nlohmann::json::object());
        }

        session.require_initialized();

        if (req.method == "tools/list") return handle_tools_list(req);
        if (req.method == "tools/call") return handle_tools_call(req);

        return Envelope::failure(req.id, error_code::method_not_found,
                                 "Method not found: " + req.method);
    } catch (const SessionError& e) {
        return Envelope::failure(req.id, e.code(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] " << req.method << " failed: " << e.what() << "\n";
        return Envelope::failure(req.id, error_code::internal_error,
                                 std::string("Internal error: ") + e.what());
    }
}

void Dispatcher::notify(const Envelope& notification, Session& session) const {
    if (notification.method == "notifications/initialized") {
        if (!session.initialized()) {
            std::cerr << "[dispatch] initialized notification on uninitialized session "
                      << session.id() << "\n";
        }
        return;
    }
    std::cerr << "[dispatch] Ignoring notification: " << notification.method << "\n";
}

Envelope Dispatcher::handle_initialize(const Envelope& req, Session& session) const {
    nlohmann::json caps = session.initialize(req.params);

    auto peer = session.peer_info();
    std::cerr << "[dispatch] Session " << session.id() << " initialized by "
              << peer.value("name", "unknown") << " (" << session.protocol_version() << ")\n";

    nlohmann::json result;
    result["protocolVersion"] = session.protocol_version();
    result["capabilities"] = caps;
    result["serverInfo"] = {{"name", info_.name}, {"version", info_.version}};
    return Envelope::success(req.id, result);
}

Envelope Dispatcher::handle_tools_list(const Envelope& req) const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& d : tools_.list_tools()) {
        arr.push_back(d.to_json());
    }
    return Envelope::success(req.id, {{"tools", arr}});
}

Envelope Dispatcher::handle_tools_call(const Envelope& req) const {
    if (!req.params.contains("name") || !req.params["name"].is_string()) {
        return Envelope::failure(req.id, error_code::invalid_arguments,
                                 "Invalid params: tool name is required");
    }
    std::string name = req.params["name"].get<std::string>();

    const ToolDef* tool = tools_.find(name);
    if (!tool) {
        return Envelope::failure(req.id, error_code::tool_not_found, "Tool not found: " + name);
    }

    nlohmann::json args = req.params.contains("arguments") ? req.params["arguments"]
                                                          : nlohmann::json::object();
    if (args.is_null()) args = nlohmann::json::object();
    if (auto problem = tool->descriptor.input_schema.validate(args)) {
        return Envelope::failure(req.id, error_code::invalid_arguments,
                                 "Invalid arguments for " + name + ": " + *problem);
    }

    InvocationResult result;
    try {
        result = tool->func(args);
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] Tool " << name << " failed: " << e.what() << "\n";
        result = InvocationResult::failure(e.what());
    } catch (...) {
        std::cerr << "[dispatch] Tool " << name << " failed with a non-standard exception\n";
        result = InvocationResult::failure("tool raised a non-standard exception");
    }
    return Envelope::success(req.id, result.to_json());
}

} // namespace toolwire
