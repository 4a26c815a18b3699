#include "envelope.hpp"

namespace toolwire {

static bool valid_id(const nlohmann::json& id) {
    return id.is_number() || id.is_string();
}

nlohmann::json Envelope::to_json() const {
    nlohmann::json j;
    j["jsonrpc"] = "2.0";
    if (is_request()) {
        if (!id.is_null()) j["id"] = id;
        j["method"] = method;
        j["params"] = params.is_null() ? nlohmann::json::object() : params;
        return j;
    }
    j["id"] = id;
    if (error) {
        auto& e = j["error"];
        e["code"] = error->code;
        e["message"] = error->message;
        if (!error->data.is_null()) e["data"] = error->data;
    } else {
        j["result"] = result.value_or(nlohmann::json::object());
    }
    return j;
}

Envelope Envelope::request(nlohmann::json id, const std::string& method, nlohmann::json params) {
    Envelope e;
    e.id = std::move(id);
    e.method = method;
    e.params = std::move(params);
    return e;
}

Envelope Envelope::notification(const std::string& method, nlohmann::json params) {
    return request(nullptr, method, std::move(params));
}

Envelope Envelope::success(nlohmann::json id, nlohmann::json result) {
    Envelope e;
    e.id = std::move(id);
    e.result = std::move(result);
    return e;
}

Envelope Envelope::failure(nlohmann::json id, int code, const std::string& message,
                           nlohmann::json data) {
    Envelope e;
    e.id = std::move(id);
    e.error = ErrorObject{code, message, std::move(data)};
    return e;
}

std::string encode(const Envelope& env) {
    // Tool output is not guaranteed to be valid UTF-8.
    return env.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Envelope decode(const std::string& bytes) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(bytes);
    } catch (const nlohmann::json::parse_error& e) {
        // e.what() quotes the offending bytes, which may not be UTF-8.
        throw DecodeError(DecodeError::Kind::parse, "parse error at byte " + std::to_string(e.byte));
    }
    return decode_json(j);
}

Envelope decode_json(const nlohmann::json& j) {
    using Kind = DecodeError::Kind;
    if (!j.is_object()) {
        throw DecodeError(Kind::invalid_request, "envelope must be a JSON object");
    }

    Envelope env;
    bool has_method = j.contains("method");
    bool has_result = j.contains("result");
    bool has_error = j.contains("error");

    if (j.contains("id")) {
        env.id = j["id"];
        // A response to an undecodable request legitimately carries id null.
        if (!valid_id(env.id) && !(env.id.is_null() && has_error)) {
            throw DecodeError(Kind::invalid_request, "id must be a number or a string");
        }
    } else if (!has_method) {
        throw DecodeError(Kind::invalid_request, "missing id");
    }

    if (!has_method && !has_result && !has_error) {
        throw DecodeError(Kind::invalid_request, "missing method, result or error", env.id);
    }

    if (has_method) {
        if (has_result || has_error) {
            throw DecodeError(Kind::invalid_request, "request must not carry result or error", env.id);
        }
        if (!j["method"].is_string() || j["method"].get<std::string>().empty()) {
            throw DecodeError(Kind::invalid_request, "method must be a non-empty string", env.id);
        }
        env.method = j["method"].get<std::string>();
        if (j.contains("params") && !j["params"].is_null()) {
            if (!j["params"].is_object()) {
                throw DecodeError(Kind::invalid_request, "params must be an object", env.id);
            }
            env.params = j["params"];
        } else {
            env.params = nlohmann::json::object();
        }
        return env;
    }

    if (has_result && has_error) {
        throw DecodeError(Kind::invalid_request, "response carries both result and error", env.id);
    }

    if (has_result) {
        env.result = j["result"];
        return env;
    }

    auto& e = j["error"];
    if (!e.is_object() || !e.contains("code") || !e["code"].is_number_integer() ||
        !e.contains("message") || !e["message"].is_string()) {
        throw DecodeError(Kind::invalid_request, "error must carry an integer code and a string message", env.id);
    }
    ErrorObject err;
    err.code = e["code"].get<int>();
    err.message = e["message"].get<std::string>();
    if (e.contains("data")) err.data = e["data"];
    env.error = std::move(err);
    return env;
}

} // namespace toolwire
