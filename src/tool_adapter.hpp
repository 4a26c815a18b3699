#pragma once
#include "tool_client.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolwire {

// A discovered remote tool, callable like a local function.
class RemoteTool {
public:
    RemoteTool(ToolClient& client, ToolDescriptor descriptor)
        : client_(&client), descriptor_(std::move(descriptor)) {}

    const std::string& name() const { return descriptor_.name; }
    const std::string& description() const { return descriptor_.description; }
    const InputSchema& schema() const { return descriptor_.input_schema; }
    const ToolDescriptor& descriptor() const { return descriptor_; }

    // {"type":"function","function":{name, description, parameters}}
    nlohmann::json function_spec() const;

    // Arguments are checked against the schema before anything is sent.
    InvocationResult operator()(const nlohmann::json& args) const;

private:
    ToolClient* client_;
    ToolDescriptor descriptor_;
};

// What an upstream reasoning component sees: named operations with
// metadata, invoked with structured arguments. No wire details leak out.
class ToolAdapter {
public:
    explicit ToolAdapter(ToolClient& client) : client_(client) {}

    // Replaces the current tool set with a fresh tools/list. Returns the count.
    size_t discover();

    const std::vector<RemoteTool>& tools() const { return tools_; }
    const RemoteTool* find(const std::string& name) const;
    std::vector<std::string> tool_names() const;
    nlohmann::json tools_spec() const;

    // Throws ProtocolError{tool_not_found} for a name discover() did not see.
    InvocationResult invoke(const std::string& name, const nlohmann::json& args) const;

private:
    ToolClient& client_;
    std::vector<RemoteTool> tools_;
};

} // namespace toolwire
