#include <gtest/gtest.h>
#include "errors.hpp"
#include "tool_registry.hpp"

namespace {

using toolwire::InvocationResult;
using toolwire::RegistryError;
using toolwire::ToolRegistry;

nlohmann::json empty_schema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

toolwire::ToolExecutor echo(const std::string& text) {
    return [text](const nlohmann::json&) { return InvocationResult::ok(text); };
}

TEST(ToolRegistryTest, ListPreservesRegistrationOrder) {
    ToolRegistry reg;
    reg.register_tool("zeta", "last letter", empty_schema(), echo("z"));
    reg.register_tool("alpha", "first letter", empty_schema(), echo("a"));
    reg.register_tool("mid", "middle", empty_schema(), echo("m"));

    auto tools = reg.list_tools();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_EQ(tools[2].name, "mid");
    EXPECT_EQ(reg.tool_names(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(ToolRegistryTest, DuplicateNameIsRejectedAndOriginalKept) {
    ToolRegistry reg;
    reg.register_tool("add", "original", empty_schema(), echo("first"));
    try {
        reg.register_tool("add", "impostor", empty_schema(), echo("second"));
        FAIL() << "expected RegistryError";
    } catch (const RegistryError& e) {
        EXPECT_EQ(e.kind(), RegistryError::Kind::duplicate_name);
    }
    ASSERT_EQ(reg.size(), 1u);
    EXPECT_EQ(reg.find("add")->descriptor.description, "original");
    EXPECT_EQ(reg.find("add")->func(nlohmann::json::object()).text(), "first");
}

TEST(ToolRegistryTest, EmptyNameIsRejected) {
    ToolRegistry reg;
    try {
        reg.register_tool("", "nameless", empty_schema(), echo(""));
        FAIL() << "expected RegistryError";
    } catch (const RegistryError& e) {
        EXPECT_EQ(e.kind(), RegistryError::Kind::invalid_name);
    }
}

TEST(ToolRegistryTest, FindUnknownReturnsNull) {
    ToolRegistry reg;
    reg.register_tool("known", "", empty_schema(), echo(""));
    EXPECT_TRUE(reg.has("known"));
    EXPECT_FALSE(reg.has("unknown"));
    EXPECT_EQ(reg.find("unknown"), nullptr);
}

TEST(ToolRegistryTest, ListingNeverRunsExecutors) {
    ToolRegistry reg;
    int calls = 0;
    reg.register_tool("counted", "", empty_schema(), [&calls](const nlohmann::json&) {
        calls++;
        return InvocationResult::ok("");
    });
    reg.list_tools();
    reg.tools_spec();
    EXPECT_EQ(calls, 0);
}

TEST(ToolRegistryTest, DescriptorJsonCarriesNoExecutor) {
    ToolRegistry reg;
    reg.register_tool("greet", "Say hello",
                      {{"type", "object"},
                       {"properties", {{"name", {{"type", "string"}}}}},
                       {"required", nlohmann::json::array({"name"})}},
                      echo("hi"));
    auto j = reg.list_tools()[0].to_json();
    EXPECT_EQ(j.size(), 3u);
    EXPECT_EQ(j["name"], "greet");
    EXPECT_EQ(j["description"], "Say hello");
    EXPECT_EQ(j["inputSchema"]["required"], nlohmann::json::array({"name"}));
}

TEST(ToolRegistryTest, ToolsSpecUsesFunctionFormat) {
    ToolRegistry reg;
    reg.register_tool("greet", "Say hello", empty_schema(), echo("hi"));
    auto spec = reg.tools_spec();
    ASSERT_EQ(spec.size(), 1u);
    EXPECT_EQ(spec[0]["type"], "function");
    EXPECT_EQ(spec[0]["function"]["name"], "greet");
    EXPECT_EQ(spec[0]["function"]["parameters"]["type"], "object");
}

TEST(ToolDescriptorTest, NullDescriptionReadsAsEmpty) {
    auto d = toolwire::ToolDescriptor::from_json(nlohmann::json::parse(R"({
        "name": "x", "description": null,
        "inputSchema": {"type": "object", "properties": {"a": {"type": "string", "description": 7}}}
    })"));
    EXPECT_EQ(d.name, "x");
    EXPECT_EQ(d.description, "");
    ASSERT_NE(d.input_schema.field("a"), nullptr);
    EXPECT_EQ(d.input_schema.field("a")->description, "");
}

TEST(ToolDescriptorTest, NonStringNameIsMalformed) {
    try {
        toolwire::ToolDescriptor::from_json({{"name", 42}});
        FAIL() << "expected TransportError";
    } catch (const toolwire::TransportError& e) {
        EXPECT_EQ(e.kind(), toolwire::TransportError::Kind::malformed);
    }
}

TEST(InvocationResultTest, PerItemFlagsWinOverTopLevel) {
    auto r = InvocationResult::from_json(nlohmann::json::parse(R"({
        "content": [{"type": "text", "text": "partial"},
                    {"type": "text", "text": "broken", "isError": true}],
        "isError": true
    })"));
    ASSERT_EQ(r.content.size(), 2u);
    EXPECT_EQ(r.content[0].kind, toolwire::ContentItem::Kind::text);
    EXPECT_EQ(r.content[1].kind, toolwire::ContentItem::Kind::error);
}

TEST(InvocationResultTest, IllTypedFieldsAreMalformed) {
    const char* bad[] = {
        R"({"content": [{"type": "text", "text": "5"}], "isError": "true"})",
        R"({"content": [{"type": "text", "text": "5", "isError": 1}]})",
        R"({"isError": false})",
        R"({"content": "5"})",
        R"([])",
    };
    for (const char* text : bad) {
        try {
            InvocationResult::from_json(nlohmann::json::parse(text));
            FAIL() << "accepted " << text;
        } catch (const toolwire::TransportError& e) {
            EXPECT_EQ(e.kind(), toolwire::TransportError::Kind::malformed) << text;
        }
    }
}

} // namespace
