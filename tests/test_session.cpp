#include <algorithm>
#include <chrono>
#include <functional>
#include <set>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "errors.hpp"
#include "session.hpp"
#include "session_store.hpp"

namespace {

using toolwire::Session;
using toolwire::SessionError;
using toolwire::SessionStore;

nlohmann::json client_hello(const std::string& version = "2024-11-05") {
    return {
        {"protocolVersion", version},
        {"capabilities", {{"roots", nlohmann::json::object()}}},
        {"clientInfo", {{"name", "tester"}, {"version", "0.1"}}}
    };
}

SessionError::Kind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const SessionError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected SessionError";
    return SessionError::Kind::closed;
}

TEST(SessionTest, StartsUninitializedAndRejectsOperations) {
    Session s(nlohmann::json{{"tools", nlohmann::json::object()}});
    EXPECT_EQ(s.state(), Session::State::uninitialized);
    EXPECT_EQ(kind_of([&] { s.require_initialized(); }), SessionError::Kind::not_initialized);
}

TEST(SessionTest, InitializeNegotiatesVersionAndReturnsCapabilities) {
    Session s(nlohmann::json{{"tools", nlohmann::json::object()}});
    auto caps = s.initialize(client_hello("2024-11-05"));
    EXPECT_TRUE(caps.contains("tools"));
    EXPECT_TRUE(s.initialized());
    EXPECT_EQ(s.protocol_version(), "2024-11-05");
    EXPECT_EQ(s.peer_info()["name"], "tester");
    EXPECT_TRUE(s.peer_capabilities().contains("roots"));
    EXPECT_NO_THROW(s.require_initialized());
}

TEST(SessionTest, MissingVersionPicksNewest) {
    Session s;
    s.initialize(nlohmann::json::object());
    EXPECT_EQ(s.protocol_version(), toolwire::SUPPORTED_PROTOCOL_VERSIONS.front());
}

TEST(SessionTest, SecondInitializeFailsAndKeepsFirstState) {
    Session s;
    s.initialize(client_hello("2024-11-05"));
    EXPECT_EQ(kind_of([&] { s.initialize(client_hello("2025-06-18")); }),
              SessionError::Kind::already_initialized);
    EXPECT_EQ(s.protocol_version(), "2024-11-05");
    EXPECT_EQ(s.peer_info()["name"], "tester");
}

TEST(SessionTest, UnsupportedVersionIsProtocolMismatch) {
    Session s;
    EXPECT_EQ(kind_of([&] { s.initialize(client_hello("1999-01-01")); }),
              SessionError::Kind::protocol_mismatch);
    EXPECT_EQ(s.state(), Session::State::uninitialized);
    EXPECT_NO_THROW(s.initialize(client_hello("2025-03-26")));
}

TEST(SessionTest, ClosedIsTerminal) {
    Session s;
    s.initialize(client_hello());
    s.close();
    s.close();
    EXPECT_TRUE(s.closed());
    EXPECT_EQ(kind_of([&] { s.require_initialized(); }), SessionError::Kind::closed);
    EXPECT_EQ(kind_of([&] { s.initialize(client_hello()); }), SessionError::Kind::closed);
    EXPECT_EQ(kind_of([&] { s.next_request_id(); }), SessionError::Kind::closed);
}

TEST(SessionTest, EstablishRecordsServerAnswer) {
    Session s;
    s.establish({{"protocolVersion", "2025-06-18"},
                 {"capabilities", {{"tools", {{"listChanged", false}}}}},
                 {"serverInfo", {{"name", "calc"}}}});
    EXPECT_TRUE(s.initialized());
    EXPECT_EQ(s.peer_info()["name"], "calc");
    EXPECT_EQ(kind_of([&] { s.establish({{"protocolVersion", "2025-06-18"}}); }),
              SessionError::Kind::already_initialized);
}

TEST(SessionTest, EstablishRejectsUnknownVersion) {
    Session s;
    EXPECT_EQ(kind_of([&] { s.establish({{"protocolVersion", "3000-01-01"}}); }),
              SessionError::Kind::protocol_mismatch);
}

TEST(SessionTest, RequestIdsAreMonotonic) {
    Session s;
    EXPECT_EQ(s.next_request_id(), 1);
    EXPECT_EQ(s.next_request_id(), 2);
    EXPECT_EQ(s.next_request_id(), 3);
}

TEST(SessionTest, RequestIdsAreUniqueUnderConcurrency) {
    Session s;
    constexpr int threads = 8;
    constexpr int per_thread = 1000;
    std::vector<std::vector<int64_t>> seen(threads);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < per_thread; i++) seen[t].push_back(s.next_request_id());
        });
    }
    for (auto& w : workers) w.join();

    std::set<int64_t> all;
    for (auto& v : seen) {
        EXPECT_TRUE(std::is_sorted(v.begin(), v.end()));
        all.insert(v.begin(), v.end());
    }
    EXPECT_EQ(all.size(), static_cast<size_t>(threads * per_thread));
    EXPECT_EQ(*all.begin(), 1);
    EXPECT_EQ(*all.rbegin(), threads * per_thread);
}

TEST(SessionTest, IdsAreDistinct) {
    Session a, b;
    EXPECT_FALSE(a.id().empty());
    EXPECT_NE(a.id(), b.id());
}

TEST(SessionStoreTest, CreateFindClose) {
    SessionStore store(nlohmann::json{{"tools", nlohmann::json::object()}});
    auto s = store.create();
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find(s->id()), s);
    EXPECT_TRUE(s->local_capabilities().contains("tools"));

    EXPECT_TRUE(store.close(s->id()));
    EXPECT_TRUE(s->closed());
    EXPECT_EQ(store.find(s->id()), nullptr);
    EXPECT_FALSE(store.close(s->id()));
    EXPECT_EQ(store.size(), 0u);
}

TEST(SessionStoreTest, SessionsAreIndependent) {
    SessionStore store(nlohmann::json::object());
    auto a = store.create();
    auto b = store.create();
    a->initialize(client_hello());
    EXPECT_TRUE(a->initialized());
    EXPECT_FALSE(b->initialized());
    store.close_all();
    EXPECT_TRUE(a->closed());
    EXPECT_TRUE(b->closed());
    EXPECT_EQ(store.size(), 0u);
}

TEST(SessionStoreTest, IdleSessionsAreReaped) {
    SessionStore store(nlohmann::json::object(), std::chrono::milliseconds(200));
    auto idle = store.create();
    auto busy = store.create();

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    store.find(busy->id());
    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    EXPECT_EQ(store.reap_idle(), 1u);
    EXPECT_TRUE(idle->closed());
    EXPECT_FALSE(busy->closed());
    EXPECT_EQ(store.find(idle->id()), nullptr);
    EXPECT_EQ(store.size(), 1u);
}

TEST(SessionStoreTest, ZeroTimeoutNeverReaps) {
    SessionStore store(nlohmann::json::object());
    store.create();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(store.reap_idle(), 0u);
    EXPECT_EQ(store.size(), 1u);
}

} // namespace
