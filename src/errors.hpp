#pragma once
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace toolwire {

// Wire error codes. The first five are JSON-RPC 2.0, the rest are ours.
namespace error_code {
constexpr int parse_error = -32700;
constexpr int invalid_request = -32600;
constexpr int method_not_found = -32601;
constexpr int invalid_arguments = -32602;
constexpr int internal_error = -32603;
constexpr int tool_not_found = -32001;
constexpr int session_not_initialized = -32002;
constexpr int already_initialized = -32003;
constexpr int protocol_mismatch = -32004;
constexpr int session_closed = -32005;
constexpr int rate_limited = -32006;
} // namespace error_code

class DecodeError : public std::runtime_error {
public:
    enum class Kind { parse, invalid_request };

    DecodeError(Kind kind, const std::string& msg, nlohmann::json id = nullptr)
        : std::runtime_error(msg), kind_(kind), id_(std::move(id)) {}

    Kind kind() const { return kind_; }
    // Request id if it could be recovered, null otherwise.
    const nlohmann::json& id() const { return id_; }
    int code() const {
        return kind_ == Kind::parse ? error_code::parse_error : error_code::invalid_request;
    }

private:
    Kind kind_;
    nlohmann::json id_;
};

class SessionError : public std::runtime_error {
public:
    enum class Kind { not_initialized, already_initialized, protocol_mismatch, closed };

    SessionError(Kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const { return kind_; }
    int code() const {
        switch (kind_) {
        case Kind::not_initialized: return error_code::session_not_initialized;
        case Kind::already_initialized: return error_code::already_initialized;
        case Kind::protocol_mismatch: return error_code::protocol_mismatch;
        case Kind::closed: return error_code::session_closed;
        }
        return error_code::internal_error;
    }

private:
    Kind kind_;
};

class RegistryError : public std::runtime_error {
public:
    enum class Kind { duplicate_name, invalid_name };

    RegistryError(Kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class TransportError : public std::runtime_error {
public:
    enum class Kind { timeout, unreachable, malformed };

    TransportError(Kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// A response envelope carried an `error` member.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& msg, nlohmann::json data = nullptr)
        : std::runtime_error(msg), code_(code), data_(std::move(data)) {}

    int code() const { return code_; }
    const nlohmann::json& data() const { return data_; }

private:
    int code_;
    nlohmann::json data_;
};

const char* transport_error_name(TransportError::Kind kind);

} // namespace toolwire
