#include <cstdint>
#include <limits>
#include <stdexcept>
#include <gtest/gtest.h>
#include "tools/calculator_tools.hpp"
#include "tools/greeting_tools.hpp"

namespace {

using namespace toolwire;

class CalculatorToolsTest : public ::testing::Test {
protected:
    void SetUp() override { register_calculator_tools(reg_); }

    InvocationResult run(const std::string& name, const nlohmann::json& args) {
        const ToolDef* def = reg_.find(name);
        EXPECT_NE(def, nullptr) << name;
        EXPECT_FALSE(def->descriptor.input_schema.validate(args).has_value()) << name << " " << args.dump();
        return def->func(args);
    }

    ToolRegistry reg_;
};

TEST_F(CalculatorToolsTest, IntegerArithmeticPrintsWithoutFraction) {
    EXPECT_EQ(run("add", {{"a", 2}, {"b", 3}}).text(), "5");
    EXPECT_EQ(run("subtract", {{"a", 2}, {"b", 10}}).text(), "-8");
    EXPECT_EQ(run("multiply", {{"a", -6}, {"b", 7}}).text(), "-42");
    EXPECT_EQ(run("divide", {{"a", 9}, {"b", 3}}).text(), "3");
}

TEST_F(CalculatorToolsTest, RealArithmetic) {
    EXPECT_EQ(run("add", {{"a", 1.5}, {"b", 2.25}}).text(), "3.75");
    EXPECT_EQ(run("divide", {{"a", 1}, {"b", 4}}).text(), "0.25");
    EXPECT_EQ(run("power", {{"base", 2}, {"exponent", 10}}).text(), "1024");
    EXPECT_EQ(run("sqrt", {{"number", 16}}).text(), "4");
}

TEST_F(CalculatorToolsTest, LargeIntegersDoNotOverflow) {
    int64_t big = int64_t(1) << 40;
    auto r = run("multiply", {{"a", big}, {"b", big}});
    EXPECT_FALSE(r.is_error());
    EXPECT_FALSE(r.text().empty());
}

TEST_F(CalculatorToolsTest, DomainErrorsAreToolFailures) {
    auto div = run("divide", {{"a", 1}, {"b", 0}});
    EXPECT_TRUE(div.is_error());
    EXPECT_EQ(div.text(), "Division by zero is not allowed");

    EXPECT_TRUE(run("power", {{"base", -8}, {"exponent", 0.5}}).is_error());
    EXPECT_TRUE(run("power", {{"base", 10}, {"exponent", 1000}}).is_error());
}

TEST_F(CalculatorToolsTest, SchemaRejectsNegativeSqrtAndFactorial) {
    EXPECT_TRUE(reg_.find("sqrt")->descriptor.input_schema.validate({{"number", -1}}).has_value());
    EXPECT_TRUE(reg_.find("factorial")->descriptor.input_schema.validate({{"n", -3}}).has_value());
    EXPECT_TRUE(reg_.find("factorial")->descriptor.input_schema.validate({{"n", 2.5}}).has_value());
}

TEST_F(CalculatorToolsTest, Factorial) {
    EXPECT_EQ(run("factorial", {{"n", 0}}).text(), "1");
    EXPECT_EQ(run("factorial", {{"n", 5}}).text(), "120");
    EXPECT_EQ(run("factorial", {{"n", 20}}).text(), "2432902008176640000");
    EXPECT_THROW(run("factorial", {{"n", 21}}), std::overflow_error);
}

TEST_F(CalculatorToolsTest, UnsignedBeyondInt64DoesNotWrap) {
    nlohmann::json huge = std::numeric_limits<uint64_t>::max();
    auto r = run("add", {{"a", huge}, {"b", 0}});
    EXPECT_FALSE(r.is_error());
    EXPECT_NE(r.text(), "-1");
    EXPECT_NE(r.text().front(), '-');

    EXPECT_THROW(run("factorial", {{"n", huge}}), std::overflow_error);
}

TEST_F(CalculatorToolsTest, WholeFloatFactorialArgument) {
    EXPECT_EQ(run("factorial", {{"n", 6.0}}).text(), "720");
}

TEST(GreetingToolsTest, GreetsByName) {
    ToolRegistry reg;
    register_greeting_tools(reg, "toolwire");
    auto r = reg.find("get_greeting")->func({{"name", "Ada"}});
    EXPECT_EQ(r.text(), "Hello, Ada! Welcome to toolwire.");
    EXPECT_TRUE(reg.find("get_greeting")->func({{"name", ""}}).is_error());

    auto t = reg.find("get_time")->func(nlohmann::json::object());
    EXPECT_EQ(t.text().rfind("The current server time is: ", 0), 0u);
}

} // namespace
