#include "schema.hpp"
#include <algorithm>
#include <cmath>

namespace toolwire {

FieldType field_type_from_string(const std::string& s) {
    if (s == "string") return FieldType::string;
    if (s == "number") return FieldType::number;
    if (s == "integer") return FieldType::integer;
    if (s == "boolean") return FieldType::boolean;
    if (s == "object") return FieldType::object;
    if (s == "array") return FieldType::array;
    if (s == "null") return FieldType::null;
    return FieldType::any;
}

const char* field_type_name(FieldType t) {
    switch (t) {
    case FieldType::string: return "string";
    case FieldType::number: return "number";
    case FieldType::integer: return "integer";
    case FieldType::boolean: return "boolean";
    case FieldType::object: return "object";
    case FieldType::array: return "array";
    case FieldType::null: return "null";
    case FieldType::any: break;
    }
    return "any";
}

static bool matches(FieldType t, const nlohmann::json& v) {
    switch (t) {
    case FieldType::any: return true;
    case FieldType::string: return v.is_string();
    case FieldType::number: return v.is_number();
    case FieldType::integer:
        if (v.is_number_integer()) return true;
        // 3.0 is an integer in JSON Schema
        if (v.is_number_float()) {
            double d = v.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    case FieldType::boolean: return v.is_boolean();
    case FieldType::object: return v.is_object();
    case FieldType::array: return v.is_array();
    case FieldType::null: return v.is_null();
    }
    return false;
}

static const char* json_kind(const nlohmann::json& v) {
    if (v.is_number_integer()) return "integer";
    if (v.is_number()) return "number";
    return v.type_name();
}

InputSchema InputSchema::from_json(const nlohmann::json& j) {
    InputSchema s;
    if (!j.is_object()) return s;

    std::vector<std::string> required;
    if (j.contains("required") && j["required"].is_array()) {
        for (auto& r : j["required"]) {
            if (r.is_string()) required.push_back(r.get<std::string>());
        }
    }

    if (j.contains("properties") && j["properties"].is_object()) {
        for (auto& [key, prop] : j["properties"].items()) {
            SchemaField f;
            f.name = key;
            f.raw = prop;
            if (prop.is_object()) {
                if (prop.contains("type") && prop["type"].is_string()) {
                    f.type = field_type_from_string(prop["type"].get<std::string>());
                }
                if (prop.contains("description") && prop["description"].is_string()) {
                    f.description = prop["description"].get<std::string>();
                }
                if (prop.contains("minimum") && prop["minimum"].is_number()) {
                    f.minimum = prop["minimum"].get<double>();
                }
                if (prop.contains("enum") && prop["enum"].is_array()) {
                    f.enum_values = prop["enum"];
                }
            }
            f.required = std::find(required.begin(), required.end(), key) != required.end();
            s.fields_.push_back(std::move(f));
        }
    }

    // A required name without a property entry is still required.
    for (auto& r : required) {
        if (!s.field(r)) {
            SchemaField f;
            f.name = r;
            f.required = true;
            f.raw = nlohmann::json::object();
            s.fields_.push_back(std::move(f));
        }
    }

    for (auto& [key, val] : j.items()) {
        if (key != "type" && key != "properties" && key != "required") s.extra_[key] = val;
    }
    return s;
}

nlohmann::json InputSchema::to_json() const {
    nlohmann::json j = extra_;
    j["type"] = "object";
    j["properties"] = nlohmann::json::object();
    nlohmann::json req = nlohmann::json::array();
    for (auto& f : fields_) {
        j["properties"][f.name] = f.raw.is_object() ? f.raw : nlohmann::json::object();
        if (f.required) req.push_back(f.name);
    }
    if (!req.empty()) j["required"] = req;
    return j;
}

const SchemaField* InputSchema::field(const std::string& name) const {
    for (auto& f : fields_) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

std::vector<std::string> InputSchema::required_names() const {
    std::vector<std::string> names;
    for (auto& f : fields_) {
        if (f.required) names.push_back(f.name);
    }
    return names;
}

std::optional<std::string> InputSchema::validate(const nlohmann::json& arguments) const {
    static const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json& args = arguments.is_null() ? empty : arguments;
    if (!args.is_object()) {
        return std::string("arguments must be an object, got ") + json_kind(args);
    }

    for (auto& f : fields_) {
        auto it = args.find(f.name);
        if (it == args.end()) {
            if (f.required) return "missing required argument '" + f.name + "'";
            continue;
        }
        const auto& v = *it;
        if (!matches(f.type, v)) {
            return "argument '" + f.name + "' must be " + field_type_name(f.type) +
                   ", got " + json_kind(v);
        }
        if (f.minimum && v.is_number() && v.get<double>() < *f.minimum) {
            return "argument '" + f.name + "' must be >= " + nlohmann::json(*f.minimum).dump();
        }
        if (f.enum_values.is_array() &&
            std::find(f.enum_values.begin(), f.enum_values.end(), v) == f.enum_values.end()) {
            return "argument '" + f.name + "' must be one of " + f.enum_values.dump();
        }
    }
    return std::nullopt;
}

} // namespace toolwire
