#pragma once
#include "../tool_registry.hpp"

namespace toolwire {
// add, subtract, multiply, divide, power, sqrt, factorial
void register_calculator_tools(ToolRegistry& reg);
} // namespace toolwire
