#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "errors.hpp"

namespace toolwire {

struct ContentItem {
    enum class Kind { text, error };

    Kind kind = Kind::text;
    std::string text;

    bool operator==(const ContentItem& o) const { return kind == o.kind && text == o.text; }
};

// Outcome of a dispatched tools/call. An error item means the tool ran and
// failed; the call itself still succeeded at protocol level.
struct InvocationResult {
    std::vector<ContentItem> content;

    static InvocationResult ok(const std::string& text) {
        InvocationResult r;
        r.content.push_back({ContentItem::Kind::text, text});
        return r;
    }

    static InvocationResult failure(const std::string& message) {
        InvocationResult r;
        r.content.push_back({ContentItem::Kind::error, message});
        return r;
    }

    bool is_error() const {
        for (auto& item : content) {
            if (item.kind == ContentItem::Kind::error) return true;
        }
        return false;
    }

    std::string text() const {
        std::string out;
        for (auto& item : content) {
            if (!out.empty()) out += "\n";
            out += item.text;
        }
        return out;
    }

    bool operator==(const InvocationResult& o) const { return content == o.content; }

    nlohmann::json to_json() const {
        nlohmann::json arr = nlohmann::json::array();
        for (auto& item : content) {
            nlohmann::json c = {{"type", "text"}, {"text", item.text}};
            if (item.kind == ContentItem::Kind::error) c["isError"] = true;
            arr.push_back(std::move(c));
        }
        return {{"content", arr}, {"isError", is_error()}};
    }

    // Parses a tools/call result. Throws TransportError{malformed} when the
    // shape is wrong.
    static InvocationResult from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("content") || !j["content"].is_array()) {
            throw TransportError(TransportError::Kind::malformed, "tools/call result has no content array");
        }
        if (j.contains("isError") && !j["isError"].is_boolean()) {
            throw TransportError(TransportError::Kind::malformed, "tools/call isError must be a boolean");
        }

        // Servers that only set the top-level flag mark every item as failed.
        bool all_failed = j.contains("isError") && j["isError"].get<bool>();
        bool any_item_flag = false;
        for (auto& c : j["content"]) {
            if (!c.is_object()) continue;
            if (c.contains("isError")) {
                if (!c["isError"].is_boolean()) {
                    throw TransportError(TransportError::Kind::malformed,
                                         "content item isError must be a boolean");
                }
                if (c["isError"].get<bool>()) any_item_flag = true;
            }
        }

        InvocationResult r;
        for (auto& c : j["content"]) {
            if (!c.is_object()) continue;
            ContentItem item;
            bool is_text = c.contains("type") && c["type"] == "text";
            if (is_text && c.contains("text") && c["text"].is_string()) {
                item.text = c["text"].get<std::string>();
            } else {
                item.text = c.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            }
            bool failed = any_item_flag ? (c.contains("isError") && c["isError"].get<bool>()) : all_failed;
            item.kind = failed ? ContentItem::Kind::error : ContentItem::Kind::text;
            r.content.push_back(std::move(item));
        }
        return r;
    }
};

} // namespace toolwire
