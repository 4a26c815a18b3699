#include "calculator_tools.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace toolwire {

namespace {

nlohmann::json binary_schema(const std::string& a_desc, const std::string& b_desc) {
    return {
        {"type", "object"},
        {"properties", {
            {"a", {{"type", "number"}, {"description", a_desc}}},
            {"b", {{"type", "number"}, {"description", b_desc}}}
        }},
        {"required", nlohmann::json::array({"a", "b"})}
    };
}

constexpr int64_t SAFE_ADD = int64_t(1) << 62;
constexpr int64_t SAFE_MUL = int64_t(1) << 31;

bool within(int64_t v, int64_t limit) { return v > -limit && v < limit; }

// True when v reads as int64_t without wrapping.
bool fits_int64(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    return v.is_number_integer();
}

bool both_integers(const nlohmann::json& a, const nlohmann::json& b) {
    return fits_int64(a) && fits_int64(b);
}

// Integral results print without a fractional part.
std::string format_number(double v) {
    if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15) {
        return std::to_string(static_cast<int64_t>(v));
    }
    return nlohmann::json(v).dump();
}

template <typename IntOp, typename RealOp>
ToolExecutor arithmetic(IntOp int_op, RealOp real_op) {
    return [int_op, real_op](const nlohmann::json& args) -> InvocationResult {
        const auto& a = args["a"];
        const auto& b = args["b"];
        if (both_integers(a, b)) {
            int64_t out = 0;
            if (int_op(a.get<int64_t>(), b.get<int64_t>(), out)) {
                return InvocationResult::ok(std::to_string(out));
            }
        }
        return InvocationResult::ok(format_number(real_op(a.get<double>(), b.get<double>())));
    };
}

} // namespace

void register_calculator_tools(ToolRegistry& reg) {
    reg.register_tool("add", "Add two numbers", binary_schema("First number", "Second number"),
        arithmetic([](int64_t a, int64_t b, int64_t& out) {
                       if (!within(a, SAFE_ADD) || !within(b, SAFE_ADD)) return false;
                       out = a + b;
                       return true;
                   },
                   [](double a, double b) { return a + b; }));

    reg.register_tool("subtract", "Subtract second number from first number",
        binary_schema("First number (minuend)", "Second number (subtrahend)"),
        arithmetic([](int64_t a, int64_t b, int64_t& out) {
                       if (!within(a, SAFE_ADD) || !within(b, SAFE_ADD)) return false;
                       out = a - b;
                       return true;
                   },
                   [](double a, double b) { return a - b; }));

    reg.register_tool("multiply", "Multiply two numbers", binary_schema("First number", "Second number"),
        arithmetic([](int64_t a, int64_t b, int64_t& out) {
                       if (!within(a, SAFE_MUL) || !within(b, SAFE_MUL)) return false;
                       out = a * b;
                       return true;
                   },
                   [](double a, double b) { return a * b; }));

    reg.register_tool("divide", "Divide first number by second number", binary_schema("Dividend", "Divisor"),
        [](const nlohmann::json& args) -> InvocationResult {
            double b = args["b"].get<double>();
            if (b == 0.0) return InvocationResult::failure("Division by zero is not allowed");
            return InvocationResult::ok(format_number(args["a"].get<double>() / b));
        });

    reg.register_tool("power", "Raise first number to the power of second number",
        nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "base": {"type": "number", "description": "Base number"},
                "exponent": {"type": "number", "description": "Exponent"}
            },
            "required": ["base", "exponent"]
        })JSON"),
        [](const nlohmann::json& args) -> InvocationResult {
            double v = std::pow(args["base"].get<double>(), args["exponent"].get<double>());
            if (std::isnan(v)) return InvocationResult::failure("Result is not a real number");
            if (std::isinf(v)) return InvocationResult::failure("Result is out of range");
            return InvocationResult::ok(format_number(v));
        });

    reg.register_tool("sqrt", "Calculate square root of a number",
        nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "number": {"type": "number", "description": "Number to calculate square root of", "minimum": 0}
            },
            "required": ["number"]
        })JSON"),
        [](const nlohmann::json& args) -> InvocationResult {
            double n = args["number"].get<double>();
            if (n < 0) return InvocationResult::failure("Cannot calculate square root of negative number");
            return InvocationResult::ok(format_number(std::sqrt(n)));
        });

    reg.register_tool("factorial", "Calculate factorial of a non-negative integer",
        nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "n": {"type": "integer", "description": "Non-negative integer", "minimum": 0}
            },
            "required": ["n"]
        })JSON"),
        [](const nlohmann::json& args) -> InvocationResult {
            const auto& arg = args["n"];
            // 20! is the largest factorial a uint64_t holds.
            if (arg.get<double>() < 0) {
                return InvocationResult::failure("Factorial is not defined for negative numbers");
            }
            if (arg.get<double>() > 20) {
                throw std::overflow_error(arg.dump() + "! does not fit in 64 bits");
            }
            auto n = static_cast<uint64_t>(arg.get<double>());
            uint64_t acc = 1;
            for (uint64_t i = 2; i <= n; i++) acc *= i;
            return InvocationResult::ok(std::to_string(acc));
        });
}

} // namespace toolwire
