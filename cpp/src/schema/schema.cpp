// ==============================================================================
// schema.cpp - Модель схем фактов
// ==============================================================================

#include <factforge/schema.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace factforge {

// ============================================================================
// FieldType
// ============================================================================

std::string to_string(FieldType type) {
    switch (type) {
    case FieldType::String:
        return "string";
    case FieldType::Integer:
        return "integer";
    case FieldType::Long:
        return "long";
    case FieldType::Double:
        return "double";
    case FieldType::Boolean:
        return "boolean";
    case FieldType::Object:
        return "object";
    case FieldType::List:
        return "list";
    case FieldType::Map:
        return "map";
    }
    return "unknown";
}

std::string declared_type_name(FieldType type) {
    switch (type) {
    case FieldType::String:
        return "String";
    case FieldType::Integer:
        return "Integer";
    case FieldType::Long:
        return "Long";
    case FieldType::Double:
        return "Double";
    case FieldType::Boolean:
        return "Boolean";
    case FieldType::Object:
        return "Object";
    case FieldType::List:
        return "java.util.List";
    case FieldType::Map:
        return "java.util.Map";
    }
    return "Object";
}

// ============================================================================
// Name utilities
// ============================================================================

std::string capitalize(std::string_view s) {
    std::string out(s);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

std::string decapitalize(std::string_view s) {
    std::string out(s);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    }
    return out;
}

bool is_identifier(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    auto first = static_cast<unsigned char>(s[0]);
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    return std::all_of(s.begin() + 1, s.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc == '_';
    });
}

bool is_valid_schema_name(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    return std::none_of(s.begin(), s.end(),
                        [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

// ============================================================================
// FieldSpec
// ============================================================================

FieldSpec FieldSpec::reference(std::string field_name, std::string schema_name, bool is_required) {
    FieldSpec spec(std::move(field_name), FieldType::Object, is_required);
    spec.object_type = std::move(schema_name);
    return spec;
}

FieldSpec FieldSpec::list_of(std::string field_name, std::string element_hint, bool is_required) {
    FieldSpec spec(std::move(field_name), FieldType::List, is_required);
    spec.element_type = std::move(element_hint);
    return spec;
}

std::string FieldSpec::getter_name() const {
    if (type == FieldType::Boolean) {
        return "is" + capitalize(name);
    }
    return "get" + capitalize(name);
}

std::string FieldSpec::setter_name() const {
    return "set" + capitalize(name);
}

bool FieldSpec::is_primitive() const {
    switch (type) {
    case FieldType::String:
    case FieldType::Integer:
    case FieldType::Long:
    case FieldType::Double:
    case FieldType::Boolean:
        return true;
    default:
        return false;
    }
}

bool FieldSpec::operator==(const FieldSpec& other) const {
    return name == other.name && type == other.type && required == other.required &&
           default_value == other.default_value && object_type == other.object_type &&
           element_type == other.element_type;
}

// ============================================================================
// ObjectSchema
// ============================================================================

ObjectSchema::ObjectSchema(std::string name, std::string ns)
    : name_(std::move(name)), ns_(std::move(ns)) {
    if (!is_valid_schema_name(name_)) {
        throw std::invalid_argument("schema name cannot be empty or contain whitespace: '" +
                                    name_ + "'");
    }
}

ObjectSchema& ObjectSchema::add_field(FieldSpec field) {
    if (field.name.empty()) {
        throw std::invalid_argument("field name cannot be empty in schema '" + name_ + "'");
    }
    if (has_field(field.name)) {
        throw std::invalid_argument("field with name '" + field.name +
                                    "' already exists in schema '" + name_ + "'");
    }
    if (field.type == FieldType::Object && field.object_type.empty()) {
        throw std::invalid_argument("object field '" + field.name +
                                    "' must name the referenced schema");
    }
    fields_.push_back(std::move(field));
    return *this;
}

std::string ObjectSchema::qualified_name() const {
    if (ns_.empty()) {
        return name_;
    }
    return ns_ + "." + name_;
}

const FieldSpec* ObjectSchema::field(std::string_view field_name) const {
    for (const auto& f : fields_) {
        if (f.name == field_name) {
            return &f;
        }
    }
    return nullptr;
}

std::optional<std::size_t> ObjectSchema::index_of(std::string_view field_name) const {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == field_name) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<const FieldSpec*> ObjectSchema::required_fields() const {
    std::vector<const FieldSpec*> out;
    for (const auto& f : fields_) {
        if (f.required) {
            out.push_back(&f);
        }
    }
    return out;
}

std::vector<std::string> ObjectSchema::field_names() const {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& f : fields_) {
        out.push_back(f.name);
    }
    return out;
}

std::vector<std::string> ObjectSchema::missing_required(const ValueObject& data) const {
    std::vector<std::string> missing;
    for (const auto& f : fields_) {
        if (!f.required) {
            continue;
        }
        auto it = data.find(f.name);
        if (it == data.end() || it->second.is_null()) {
            missing.push_back(f.name);
        }
    }
    return missing;
}

std::string ObjectSchema::summary() const {
    std::ostringstream oss;
    oss << "ObjectSchema: " << qualified_name() << "\n";
    oss << "Fields (" << fields_.size() << "):\n";
    for (const auto& f : fields_) {
        oss << "  - " << f.name << " (" << to_string(f.type);
        if (f.type == FieldType::Object) {
            oss << " " << f.object_type;
        }
        oss << ")";
        if (f.required) {
            oss << " [REQUIRED]";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ObjectSchema::same_content(const ObjectSchema& other) const {
    return name_ == other.name_ && ns_ == other.ns_ && fields_ == other.fields_;
}

}  // namespace factforge
