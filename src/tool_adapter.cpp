#include "tool_adapter.hpp"
#include <iostream>

namespace toolwire {

nlohmann::json RemoteTool::function_spec() const {
    nlohmann::json params = descriptor_.input_schema.to_json();
    return {
        {"type", "function"},
        {"function", {
            {"name", descriptor_.name},
            {"description", descriptor_.description.empty() ? "Remote tool: " + descriptor_.name
                                                            : descriptor_.description},
            {"parameters", params}
        }}
    };
}

InvocationResult RemoteTool::operator()(const nlohmann::json& args) const {
    nlohmann::json payload = args.is_null() ? nlohmann::json::object() : args;
    if (auto problem = descriptor_.input_schema.validate(payload)) {
        throw ProtocolError(error_code::invalid_arguments,
                            "Invalid arguments for " + descriptor_.name + ": " + *problem);
    }
    return client_->call_tool(descriptor_.name, payload);
}

size_t ToolAdapter::discover() {
    std::vector<RemoteTool> found;
    for (auto& d : client_.list_tools()) {
        found.emplace_back(client_, std::move(d));
    }
    tools_ = std::move(found);
    std::cerr << "[client] Discovered " << tools_.size() << " tools\n";
    return tools_.size();
}

const RemoteTool* ToolAdapter::find(const std::string& name) const {
    for (auto& t : tools_) {
        if (t.name() == name) return &t;
    }
    return nullptr;
}

std::vector<std::string> ToolAdapter::tool_names() const {
    std::vector<std::string> names;
    for (auto& t : tools_) names.push_back(t.name());
    return names;
}

nlohmann::json ToolAdapter::tools_spec() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& t : tools_) arr.push_back(t.function_spec());
    return arr;
}

InvocationResult ToolAdapter::invoke(const std::string& name, const nlohmann::json& args) const {
    const RemoteTool* tool = find(name);
    if (!tool) {
        throw ProtocolError(error_code::tool_not_found, "Tool not found: " + name);
    }
    return (*tool)(args);
}

} // namespace toolwire
