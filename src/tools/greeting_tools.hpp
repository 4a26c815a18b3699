#pragma once
#include "../tool_registry.hpp"

namespace toolwire {
void register_greeting_tools(ToolRegistry& reg, const std::string& server_name);
} // namespace toolwire
