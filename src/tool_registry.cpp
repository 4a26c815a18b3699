#include "tool_registry.hpp"
#include "errors.hpp"

namespace toolwire {

ToolDescriptor ToolDescriptor::from_json(const nlohmann::json& j) {
    ToolDescriptor d;
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        throw TransportError(TransportError::Kind::malformed, "tool descriptor without a string name");
    }
    d.name = j["name"].get<std::string>();
    // null or missing description reads as empty
    if (j.contains("description") && j["description"].is_string()) {
        d.description = j["description"].get<std::string>();
    }
    if (j.contains("inputSchema")) {
        d.input_schema = InputSchema::from_json(j["inputSchema"]);
    }
    return d;
}

void ToolRegistry::register_tool(ToolDescriptor descriptor, ToolExecutor func) {
    if (descriptor.name.empty()) {
        throw RegistryError(RegistryError::Kind::invalid_name, "tool name must not be empty");
    }
    if (has(descriptor.name)) {
        throw RegistryError(RegistryError::Kind::duplicate_name,
                            "Duplicate tool: " + descriptor.name);
    }
    index_[descriptor.name] = tools_.size();
    auto def = std::make_unique<ToolDef>();
    def->descriptor = std::move(descriptor);
    def->func = std::move(func);
    tools_.push_back(std::move(def));
}

void ToolRegistry::register_tool(const std::string& name, const std::string& description,
                                 const nlohmann::json& input_schema, ToolExecutor func) {
    ToolDescriptor d;
    d.name = name;
    d.description = description;
    d.input_schema = InputSchema::from_json(input_schema);
    register_tool(std::move(d), std::move(func));
}

const ToolDef* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return tools_[it->second].get();
}

std::vector<ToolDescriptor> ToolRegistry::list_tools() const {
    std::vector<ToolDescriptor> out;
    out.reserve(tools_.size());
    for (auto& t : tools_) out.push_back(t->descriptor);
    return out;
}

std::vector<std::string> ToolRegistry::tool_names() const {
    std::vector<std::string> names;
    for (auto& t : tools_) names.push_back(t->descriptor.name);
    return names;
}

nlohmann::json ToolRegistry::tools_spec() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& t : tools_) {
        arr.push_back({
            {"type", "function"},
            {"function", {
                {"name", t->descriptor.name},
                {"description", t->descriptor.description},
                {"parameters", t->descriptor.input_schema.to_json()}
            }}
        });
    }
    return arr;
}

} // namespace toolwire
