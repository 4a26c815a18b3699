#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace toolwire {

// HTTP header carrying Session::id().
constexpr const char* SESSION_HEADER = "Mcp-Session-Id";

// Newest first.
extern const std::vector<std::string> SUPPORTED_PROTOCOL_VERSIONS;

bool protocol_version_supported(const std::string& version);

// Per-connection protocol state: negotiated version and capabilities plus
// the request id counter. Uninitialized -> Initialized -> Closed.
class Session {
public:
    enum class State { uninitialized, initialized, closed };

    explicit Session(nlohmann::json local_capabilities = nlohmann::json::object());
    Session(std::string id, nlohmann::json local_capabilities);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Server side: accept the client's initialize params and return our
    // capabilities. Throws SessionError.
    nlohmann::json initialize(const nlohmann::json& client_info);

    // Client side: record what the server answered to initialize.
    void establish(const nlohmann::json& server_result);

    void require_initialized() const;
    void close();

    // Monotonic from 1, never reused. Throws SessionError once closed.
    int64_t next_request_id();

    State state() const;
    bool initialized() const { return state() == State::initialized; }
    bool closed() const { return state() == State::closed; }

    const std::string& id() const { return id_; }
    std::string protocol_version() const;
    nlohmann::json local_capabilities() const { return local_capabilities_; }
    nlohmann::json peer_capabilities() const;
    nlohmann::json peer_info() const;

private:
    std::string id_;
    nlohmann::json local_capabilities_;

    mutable std::mutex mutex_;
    State state_ = State::uninitialized;
    std::string protocol_version_;
    nlohmann::json peer_capabilities_ = nlohmann::json::object();
    nlohmann::json peer_info_ = nlohmann::json::object();

    std::atomic<int64_t> next_id_{1};
};

std::string generate_session_id();

} // namespace toolwire
