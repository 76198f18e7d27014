// ==============================================================================
// error.cpp - Сообщения ошибок материализации
// ==============================================================================

#include <factforge/error.hpp>

#include <sstream>

namespace factforge {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += items[i];
    }
    return out;
}

std::string materialization_message(const std::string& message,
                                    const std::vector<Diagnostic>& diagnostics) {
    if (diagnostics.empty()) {
        return message;
    }
    std::ostringstream oss;
    oss << message;
    for (const auto& d : diagnostics) {
        oss << "\n  " << d.format();
    }
    return oss.str();
}

}  // namespace

SchemaNotFoundError::SchemaNotFoundError(std::string schema_name)
    : Error("schema not found: '" + schema_name + "'"), schema_name_(std::move(schema_name)) {}

ValidationError::ValidationError(std::string schema_name, std::vector<std::string> missing_fields)
    : Error("missing required fields for '" + schema_name + "': [" + join(missing_fields) + "]"),
      schema_name_(std::move(schema_name)),
      missing_fields_(std::move(missing_fields)) {}

CoercionError::CoercionError(std::string field, std::string target_type, std::string raw_value,
                             const std::string& reason)
    : Error("cannot coerce value '" + raw_value + "' of field '" + field + "' to " + target_type +
            (reason.empty() ? std::string() : ": " + reason)),
      field_(std::move(field)),
      target_type_(std::move(target_type)),
      raw_value_(std::move(raw_value)) {}

std::string Diagnostic::format() const {
    std::ostringstream oss;
    oss << line << ":" << column << ": ";
    if (field) {
        oss << "field '" << *field << "': ";
    }
    oss << message;
    return oss.str();
}

MaterializationError::MaterializationError(Kind kind, const std::string& message,
                                           std::string source,
                                           std::vector<Diagnostic> diagnostics)
    : Error(materialization_message(message, diagnostics)),
      kind_(kind),
      source_(std::move(source)),
      diagnostics_(std::move(diagnostics)) {}

UnsupportedOperationError::UnsupportedOperationError(std::string method,
                                                     const std::string& message)
    : Error(message), method_(std::move(method)) {}

FieldNotFoundError::FieldNotFoundError(std::string schema_name, std::string field)
    : Error("no field '" + field + "' in schema '" + schema_name + "'"), field_(std::move(field)) {}

}  // namespace factforge
