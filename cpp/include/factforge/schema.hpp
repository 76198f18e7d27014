// ==============================================================================
// factforge/schema.hpp - Модель схем фактов
// ==============================================================================
//
// Назначение:
// - FieldType: логические типы полей
// - FieldSpec: поле схемы (тип, обязательность, default, ссылки)
// - ObjectSchema: именованный упорядоченный список полей
// - Соглашения об именах аксессоров (getX / isX / setX)
//
// ==============================================================================

#ifndef FACTFORGE_SCHEMA_HPP
#define FACTFORGE_SCHEMA_HPP

#include <factforge/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace factforge {

// ============================================================================
// FieldType
// ============================================================================

enum class FieldType {
    String,
    Integer,  // 32-bit
    Long,     // 64-bit
    Double,
    Boolean,
    Object,  // ссылка на другую схему
    List,
    Map
};

/// "string", "integer", "long", "double", "boolean", "object", "list", "map"
std::string to_string(FieldType type);

/// Каноническое имя типа в declare-тексте (String, Integer, ..., java.util.List)
std::string declared_type_name(FieldType type);

// ============================================================================
// FieldSpec
// ============================================================================

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::String;
    bool required = false;

    /// Значение по умолчанию (Null - нет значения)
    Value default_value;

    /// Для Object: имя схемы, на которую ссылается поле
    std::string object_type;

    /// Для List: подсказка типа элемента (пусто - без подсказки)
    std::string element_type;

    FieldSpec() = default;
    FieldSpec(std::string field_name, FieldType field_type, bool is_required = false)
        : name(std::move(field_name)), type(field_type), required(is_required) {}

    /// Поле-ссылка на схему
    static FieldSpec reference(std::string field_name, std::string schema_name,
                               bool is_required = false);

    /// Поле-список с подсказкой типа элемента
    static FieldSpec list_of(std::string field_name, std::string element_hint,
                             bool is_required = false);

    /// Поле со значением по умолчанию
    FieldSpec& with_default(Value v) {
        default_value = std::move(v);
        return *this;
    }

    /// isName для Boolean, getName для остальных
    std::string getter_name() const;

    /// setName
    std::string setter_name() const;

    bool is_primitive() const;
    bool is_collection() const { return type == FieldType::List || type == FieldType::Map; }
    bool has_default() const { return !default_value.is_null(); }

    bool operator==(const FieldSpec& other) const;
    bool operator!=(const FieldSpec& other) const { return !(*this == other); }
};

// ============================================================================
// ObjectSchema
// ============================================================================

class ObjectSchema {
public:
    ObjectSchema() = default;

    /// @throw std::invalid_argument если имя пустое или содержит пробелы
    explicit ObjectSchema(std::string name, std::string ns = {});

    /// Добавить поле
    /// @throw std::invalid_argument при пустом/повторном имени или Object без ссылки
    ObjectSchema& add_field(FieldSpec field);

    ObjectSchema& add_field(std::string name, FieldType type, bool required = false) {
        return add_field(FieldSpec(std::move(name), type, required));
    }

    const std::string& name() const { return name_; }
    const std::string& ns() const { return ns_; }
    void set_ns(std::string ns) { ns_ = std::move(ns); }

    /// ns.Name или Name
    std::string qualified_name() const;

    const std::vector<FieldSpec>& fields() const { return fields_; }
    std::size_t field_count() const { return fields_.size(); }

    /// nullptr если поля нет
    const FieldSpec* field(std::string_view field_name) const;
    std::optional<std::size_t> index_of(std::string_view field_name) const;
    bool has_field(std::string_view field_name) const { return field(field_name) != nullptr; }

    std::vector<const FieldSpec*> required_fields() const;
    std::vector<std::string> field_names() const;

    /// Имена обязательных полей, которые отсутствуют или null в data
    std::vector<std::string> missing_required(const ValueObject& data) const;

    /// Ревизия, назначенная реестром при регистрации (0 - не зарегистрирована)
    std::uint64_t revision() const { return revision_; }
    void set_revision(std::uint64_t revision) { revision_ = revision; }

    /// Краткое описание схемы для логов
    std::string summary() const;

    /// Равенство по содержимому (ревизия не учитывается)
    bool same_content(const ObjectSchema& other) const;

private:
    std::string name_;
    std::string ns_;
    std::vector<FieldSpec> fields_;
    std::uint64_t revision_ = 0;
};

// ============================================================================
// Name utilities
// ============================================================================

/// "name" -> "Name"
std::string capitalize(std::string_view s);

/// "Name" -> "name"
std::string decapitalize(std::string_view s);

/// [A-Za-z_][A-Za-z0-9_]*
bool is_identifier(std::string_view s);

/// Непустое имя без пробельных символов
bool is_valid_schema_name(std::string_view s);

}  // namespace factforge

#endif  // FACTFORGE_SCHEMA_HPP
