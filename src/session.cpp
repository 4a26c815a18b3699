#include "session.hpp"
#include "errors.hpp"
#include <algorithm>
#include <random>
#include <sstream>
#include <iomanip>

namespace toolwire {

const std::vector<std::string> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18", "2025-03-26", "2024-11-05"
};

bool protocol_version_supported(const std::string& version) {
    return std::find(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                     version) != SUPPORTED_PROTOCOL_VERSIONS.end();
}

std::string generate_session_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return ss.str();
}

Session::Session(nlohmann::json local_capabilities)
    : Session(generate_session_id(), std::move(local_capabilities)) {}

Session::Session(std::string id, nlohmann::json local_capabilities)
    : id_(std::move(id)), local_capabilities_(std::move(local_capabilities)) {}

nlohmann::json Session::initialize(const nlohmann::json& client_info) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::closed) {
        throw SessionError(SessionError::Kind::closed, "session is closed");
    }
    if (state_ == State::initialized) {
        throw SessionError(SessionError::Kind::already_initialized, "session already initialized");
    }

    std::string version = SUPPORTED_PROTOCOL_VERSIONS.front();
    if (client_info.is_object() && client_info.contains("protocolVersion")) {
        const auto& v = client_info["protocolVersion"];
        if (!v.is_string() || !protocol_version_supported(v.get<std::string>())) {
            throw SessionError(SessionError::Kind::protocol_mismatch,
                               "unsupported protocol version: " +
                               (v.is_string() ? v.get<std::string>() : v.dump()));
        }
        version = v.get<std::string>();
    }

    protocol_version_ = version;
    if (client_info.is_object()) {
        if (client_info.contains("capabilities") && client_info["capabilities"].is_object())
            peer_capabilities_ = client_info["capabilities"];
        if (client_info.contains("clientInfo") && client_info["clientInfo"].is_object())
            peer_info_ = client_info["clientInfo"];
    }
    state_ = State::initialized;
    return local_capabilities_;
}

void Session::establish(const nlohmann::json& server_result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::closed) {
        throw SessionError(SessionError::Kind::closed, "session is closed");
    }
    if (state_ == State::initialized) {
        throw SessionError(SessionError::Kind::already_initialized, "session already initialized");
    }
    std::string version;
    if (server_result.is_object() && server_result.contains("protocolVersion") &&
        server_result["protocolVersion"].is_string()) {
        version = server_result["protocolVersion"].get<std::string>();
    }
    if (!protocol_version_supported(version)) {
        throw SessionError(SessionError::Kind::protocol_mismatch,
                           "server chose unsupported protocol version: " + version);
    }
    protocol_version_ = version;
    if (server_result.contains("capabilities") && server_result["capabilities"].is_object())
        peer_capabilities_ = server_result["capabilities"];
    if (server_result.contains("serverInfo") && server_result["serverInfo"].is_object())
        peer_info_ = server_result["serverInfo"];
    state_ = State::initialized;
}

void Session::require_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::uninitialized) {
        throw SessionError(SessionError::Kind::not_initialized, "session not initialized");
    }
    if (state_ == State::closed) {
        throw SessionError(SessionError::Kind::closed, "session is closed");
    }
}

int64_t Session::next_request_id() {
    if (closed()) {
        throw SessionError(SessionError::Kind::closed, "session is closed");
    }
    return next_id_.fetch_add(1, std::memory_order_relaxed);
}

void Session::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::closed;
}

Session::State Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

nlohmann::json Session::peer_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_capabilities_;
}

nlohmann::json Session::peer_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_info_;
}

} // namespace toolwire
