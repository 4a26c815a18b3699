#include "greeting_tools.hpp"
#include "../utils.hpp"

namespace toolwire {

void register_greeting_tools(ToolRegistry& reg, const std::string& server_name) {
    reg.register_tool("get_greeting", "Get a greeting message",
        nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "name": {"type": "string", "description": "The name to greet"}
            },
            "required": ["name"]
        })JSON"),
        [server_name](const nlohmann::json& args) -> InvocationResult {
            std::string name = args["name"].get<std::string>();
            if (name.empty()) return InvocationResult::failure("name must not be empty");
            return InvocationResult::ok("Hello, " + name + "! Welcome to " + server_name + ".");
        });

    reg.register_tool("get_time", "Get the current server time",
        nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}},
        [](const nlohmann::json&) {
            return InvocationResult::ok("The current server time is: " + now_str());
        });
}

} // namespace toolwire
