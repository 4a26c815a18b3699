#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace toolwire {

enum class FieldType { any, string, number, integer, boolean, object, array, null };

FieldType field_type_from_string(const std::string& s);
const char* field_type_name(FieldType t);

struct SchemaField {
    std::string name;
    FieldType type = FieldType::any;
    bool required = false;
    std::string description;
    std::optional<double> minimum;
    nlohmann::json enum_values; // array, or null when unconstrained
    nlohmann::json raw;         // the original property schema
};

// Structural view of a tool's JSON-Schema input: one flat object whose
// properties are checked by name, type and required flag.
class InputSchema {
public:
    InputSchema() = default;

    static InputSchema from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Returns a description of the first violation, or nullopt if valid.
    std::optional<std::string> validate(const nlohmann::json& arguments) const;

    const std::vector<SchemaField>& fields() const { return fields_; }
    const SchemaField* field(const std::string& name) const;
    std::vector<std::string> required_names() const;

private:
    std::vector<SchemaField> fields_;
    nlohmann::json extra_ = nlohmann::json::object(); // unknown top-level keys, kept for to_json
};

} // namespace toolwire
