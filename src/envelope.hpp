#pragma once
#include "errors.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace toolwire {

struct ErrorObject {
    int code = error_code::internal_error;
    std::string message;
    nlohmann::json data; // null when absent

    bool operator==(const ErrorObject& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

// One protocol message. Requests carry method/params, responses carry
// exactly one of result/error. A request with a null id is a notification.
struct Envelope {
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
    std::optional<nlohmann::json> result;
    std::optional<ErrorObject> error;

    bool is_request() const { return !method.empty(); }
    bool is_response() const { return result.has_value() || error.has_value(); }
    bool is_notification() const { return is_request() && id.is_null(); }

    bool operator==(const Envelope& o) const {
        return id == o.id && method == o.method && params == o.params &&
               result == o.result && error == o.error;
    }
    bool operator!=(const Envelope& o) const { return !(*this == o); }

    nlohmann::json to_json() const;

    static Envelope request(nlohmann::json id, const std::string& method,
                            nlohmann::json params = nlohmann::json::object());
    static Envelope notification(const std::string& method,
                                 nlohmann::json params = nlohmann::json::object());
    static Envelope success(nlohmann::json id, nlohmann::json result);
    static Envelope failure(nlohmann::json id, int code, const std::string& message,
                            nlohmann::json data = nullptr);
};

std::string encode(const Envelope& env);

// Throws DecodeError on unparsable bytes or a structurally invalid envelope.
Envelope decode(const std::string& bytes);
Envelope decode_json(const nlohmann::json& j);

} // namespace toolwire
