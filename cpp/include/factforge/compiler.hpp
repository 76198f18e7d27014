// ==============================================================================
// factforge/compiler.hpp - Исходный текст типов и их компиляция
// ==============================================================================
//
// Назначение:
// - generate_source: канонический исходный текст типа по схеме
// - CompiledType: раскладка слотов и таблица аксессоров
// - TypeCompiler: абстрактный компилятор исходного текста
// - LayoutCompiler: встроенный компилятор (лексер + парсер + проверки)
//
// Формат исходного текста:
//
//   class Person {
//       field 0 name : string;
//       field 1 adult : bool = false;
//       constructor(name, adult);
//       getter getName -> name;
//       setter setName -> name;
//       getter isAdult -> adult;
//       setter setAdult -> adult;
//       method toString;
//       method equals;
//       method hashCode;
//   }
//
// ==============================================================================

#ifndef FACTFORGE_COMPILER_HPP
#define FACTFORGE_COMPILER_HPP

#include <factforge/error.hpp>
#include <factforge/schema.hpp>
#include <factforge/value.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace factforge {

// ----------------------------------------------------------------------------
// Генерация исходного текста
// ----------------------------------------------------------------------------

/// Исходный текст типа: поле на каждый FieldSpec, пара аксессоров на поле,
/// конструктор по всем полям, toString/equals/hashCode
std::string generate_source(const ObjectSchema& schema);

/// Тип слота в исходном тексте: string, int32, ..., list<Address>, ref Address
std::string slot_type_name(const FieldSpec& field);

// ----------------------------------------------------------------------------
// CompiledType
// ----------------------------------------------------------------------------

enum class SlotType { String, Int32, Int64, Double, Bool, List, Map, Ref };

const char* to_string(SlotType type);

struct Slot {
    std::string name;
    SlotType type = SlotType::String;
    std::string ref_type;      // для Ref
    std::string element_type;  // для list<T>
    Value default_value;

    /// Допустимо ли значение для слота (null допустим всегда)
    bool accepts(const Value& value) const;
};

struct Accessor {
    enum class Kind { Getter, Setter };

    Kind kind = Kind::Getter;
    std::size_t slot = 0;
};

class CompiledType {
public:
    CompiledType(std::string name, std::string source, std::vector<Slot> slots,
                 std::unordered_map<std::string, Accessor> accessors,
                 std::vector<std::string> object_methods);

    const std::string& name() const { return name_; }

    /// Исходный текст, из которого получен тип
    const std::string& source() const { return source_; }

    const std::vector<Slot>& slots() const { return slots_; }
    std::size_t slot_count() const { return slots_.size(); }

    /// Индекс слота по имени поля; -1 если нет
    int slot_index(std::string_view field) const;

    /// nullptr если аксессора нет
    const Accessor* accessor(std::string_view method) const;

    /// toString / equals / hashCode, объявленные через method
    bool has_object_method(std::string_view method) const;

    /// Новый набор слотов, инициализированный значениями по умолчанию
    std::vector<Value> new_instance() const;

private:
    std::string name_;
    std::string source_;
    std::vector<Slot> slots_;
    std::unordered_map<std::string, Accessor> accessors_;
    std::vector<std::string> object_methods_;
};

// ----------------------------------------------------------------------------
// TypeCompiler
// ----------------------------------------------------------------------------

struct CompileResult {
    bool ok = false;
    std::shared_ptr<const CompiledType> type;
    std::vector<Diagnostic> diagnostics;

    explicit operator bool() const { return ok; }
};

class TypeCompiler {
public:
    virtual ~TypeCompiler() = default;

    /// Доступен ли компилятор в текущем окружении
    virtual bool available() const = 0;

    /// Имя для журнала
    virtual std::string name() const = 0;

    /// Компиляция без побочных эффектов; повторные вызовы независимы
    virtual CompileResult compile(std::string_view source) const = 0;
};

/// Встроенный компилятор формата layout
class LayoutCompiler : public TypeCompiler {
public:
    bool available() const override { return true; }
    std::string name() const override { return "layout"; }
    CompileResult compile(std::string_view source) const override;
};

}  // namespace factforge

#endif  // FACTFORGE_COMPILER_HPP
