// ==============================================================================
// factforge/error.hpp - Таксономия ошибок материализации
// ==============================================================================
//
// Назначение:
// - Общий базовый класс Error с позицией элемента в пакете
// - SchemaNotFoundError / ValidationError / CoercionError
// - MaterializationError (исходник + диагностика компилятора)
// - UnsupportedOperationError / FieldNotFoundError / JsonParseError
//
// Ошибки регистрации схем - std::invalid_argument (как parse_kind в правилах).
//
// ==============================================================================

#ifndef FACTFORGE_ERROR_HPP
#define FACTFORGE_ERROR_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace factforge {

// ----------------------------------------------------------------------------
// Error - базовая ошибка
// ----------------------------------------------------------------------------

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}

    /// Позиция элемента JSON массива, к которому относится ошибка
    const std::optional<std::size_t>& element_index() const { return element_index_; }

    void set_element_index(std::size_t index) { element_index_ = index; }

private:
    std::optional<std::size_t> element_index_;
};

/// Неизвестное имя схемы
class SchemaNotFoundError : public Error {
public:
    explicit SchemaNotFoundError(std::string schema_name);

    const std::string& schema_name() const { return schema_name_; }

private:
    std::string schema_name_;
};

/// Отсутствуют обязательные поля (перечисляются все) или элемент не объект
class ValidationError : public Error {
public:
    ValidationError(std::string schema_name, std::vector<std::string> missing_fields);

    /// Ошибка формы элемента (не объект и т.п.)
    explicit ValidationError(const std::string& message) : Error(message) {}

    const std::string& schema_name() const { return schema_name_; }
    const std::vector<std::string>& missing_fields() const { return missing_fields_; }

private:
    std::string schema_name_;
    std::vector<std::string> missing_fields_;
};

/// Значение поля невозможно привести к объявленному типу
class CoercionError : public Error {
public:
    CoercionError(std::string field, std::string target_type, std::string raw_value,
                  const std::string& reason = {});

    const std::string& field() const { return field_; }
    const std::string& target_type() const { return target_type_; }
    const std::string& raw_value() const { return raw_value_; }

private:
    std::string field_;
    std::string target_type_;
    std::string raw_value_;
};

// ----------------------------------------------------------------------------
// Диагностика компилятора типов
// ----------------------------------------------------------------------------

struct Diagnostic {
    std::size_t line = 0;
    std::size_t column = 0;
    std::string message;
    std::optional<std::string> field;  // поле схемы, к которому относится ошибка

    /// "3:5: message"
    std::string format() const;
};

/// Ошибка стратегии скомпилированных типов
class MaterializationError : public Error {
public:
    enum class Kind {
        CompilerUnavailable,  // компилятор недоступен в окружении (допустим fallback)
        CompileFailed,        // исходник отвергнут компилятором
        InstantiationFailed   // ошибка создания/заполнения экземпляра
    };

    MaterializationError(Kind kind, const std::string& message, std::string source = {},
                         std::vector<Diagnostic> diagnostics = {});

    Kind kind() const { return kind_; }
    const std::string& source() const { return source_; }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    /// Стратегия неприменима в текущем окружении
    bool compiler_unavailable() const { return kind_ == Kind::CompilerUnavailable; }

private:
    Kind kind_;
    std::string source_;
    std::vector<Diagnostic> diagnostics_;
};

/// Факт получил неизвестный вызов метода
class UnsupportedOperationError : public Error {
public:
    UnsupportedOperationError(std::string method, const std::string& message);

    const std::string& method() const { return method_; }

private:
    std::string method_;
};

/// Прямой доступ к полю, которого нет в схеме
class FieldNotFoundError : public Error {
public:
    FieldNotFoundError(std::string schema_name, std::string field);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/// Некорректный JSON или верхний уровень не объект/массив
class JsonParseError : public Error {
public:
    explicit JsonParseError(const std::string& message, std::size_t offset = 0)
        : Error(message), offset_(offset) {}

    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

}  // namespace factforge

#endif  // FACTFORGE_ERROR_HPP
