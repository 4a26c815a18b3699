#include <cstdio>
#include <gtest/gtest.h>
#include "config.hpp"

namespace {

using toolwire::Config;

TEST(ConfigTest, DefaultsWhenSectionsMissing) {
    Config c = Config::from_json(nlohmann::json::object());
    EXPECT_EQ(c.server.host, "127.0.0.1");
    EXPECT_EQ(c.server.port, 8001);
    EXPECT_EQ(c.server.rate_limit_rpm, 0);
    EXPECT_EQ(c.server.session_idle_timeout_s, 1800);
    EXPECT_TRUE(c.server.builtin_tools);
    EXPECT_EQ(c.client.timeout_ms, 30000);
    EXPECT_TRUE(c.servers.empty());
}

TEST(ConfigTest, ParsesAllSections) {
    auto j = nlohmann::json::parse(R"({
        "server": {"host": "0.0.0.0", "port": 9000, "worker_threads": 0, "rate_limit_rpm": 60,
                   "session_idle_timeout_s": 90,
                   "name": "calc", "builtin_tools": false},
        "client": {"timeout_ms": 5000, "protocol_version": "2025-03-26"},
        "servers": {
            "weather": {"url": "http://localhost:8002", "headers": {"X-Key": "abc", "X-Num": 3},
                        "timeout_ms": 1500},
            "broken": {"path": "/rpc"}
        }
    })");
    Config c = Config::from_json(j);
    EXPECT_EQ(c.server.host, "0.0.0.0");
    EXPECT_EQ(c.server.port, 9000);
    EXPECT_EQ(c.server.worker_threads, 1);
    EXPECT_EQ(c.server.rate_limit_rpm, 60);
    EXPECT_EQ(c.server.session_idle_timeout_s, 90);
    EXPECT_EQ(c.server.name, "calc");
    EXPECT_FALSE(c.server.builtin_tools);
    EXPECT_EQ(c.client.timeout_ms, 5000);
    EXPECT_EQ(c.client.protocol_version, "2025-03-26");

    ASSERT_EQ(c.servers.size(), 1u);
    auto& w = c.servers.at("weather");
    EXPECT_EQ(w.url, "http://localhost:8002");
    EXPECT_EQ(w.path, "/mcp");
    EXPECT_EQ(w.timeout_ms, 1500);
    ASSERT_EQ(w.headers.size(), 1u);
    EXPECT_EQ(w.headers.at("X-Key"), "abc");
}

TEST(ConfigTest, SaveThenLoad) {
    std::string path = testing::TempDir() + "toolwire_config_test/config.json";
    Config c;
    c.server.port = 8123;
    c.client.timeout_ms = 750;
    c.servers["calc"].url = "http://127.0.0.1:8001";
    c.save(path);

    Config loaded = Config::load(path);
    EXPECT_EQ(loaded.server.port, 8123);
    EXPECT_EQ(loaded.client.timeout_ms, 750);
    ASSERT_EQ(loaded.servers.count("calc"), 1u);
    EXPECT_EQ(loaded.servers.at("calc").url, "http://127.0.0.1:8001");
    EXPECT_EQ(loaded.to_json(), c.to_json());
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    Config c = Config::load(testing::TempDir() + "no_such_dir/none.json");
    EXPECT_EQ(c.server.port, 8001);
    EXPECT_TRUE(c.servers.empty());
}

} // namespace
