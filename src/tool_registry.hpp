#pragma once
#include "invocation.hpp"
#include "schema.hpp"
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <functional>
#include <nlohmann/json.hpp>

namespace toolwire {

// Throwing from an executor is a tool-level failure, same as returning
// InvocationResult::failure().
using ToolExecutor = std::function<InvocationResult(const nlohmann::json&)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    InputSchema input_schema;

    nlohmann::json to_json() const {
        return {
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema.to_json()}
        };
    }

    static ToolDescriptor from_json(const nlohmann::json& j);
};

struct ToolDef {
    ToolDescriptor descriptor;
    ToolExecutor func;
};

// Filled once at startup, read-only afterwards. Lookups take no lock.
class ToolRegistry {
public:
    void register_tool(ToolDescriptor descriptor, ToolExecutor func);

    // Convenience for providers that describe their schema as JSON text.
    void register_tool(const std::string& name, const std::string& description,
                       const nlohmann::json& input_schema, ToolExecutor func);

    bool has(const std::string& name) const { return index_.count(name) > 0; }
    const ToolDef* find(const std::string& name) const;

    std::vector<ToolDescriptor> list_tools() const;
    std::vector<std::string> tool_names() const;
    size_t size() const { return tools_.size(); }

    // OpenAI-style function list for an upstream reasoning component.
    nlohmann::json tools_spec() const;

private:
    std::vector<std::unique_ptr<const ToolDef>> tools_;
    std::map<std::string, size_t> index_;
};

} // namespace toolwire
