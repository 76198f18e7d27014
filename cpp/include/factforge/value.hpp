// ==============================================================================
// factforge/value.hpp - Каноническая модель значения (Value)
// ==============================================================================
//
// Назначение:
// - Единое представление значений JSON и значений полей факта
// - Конверсия из/в RapidJSON Value
// - Явная типизация чисел: UInt64 → Int64 → Double
// - Структурное равенство, хеш и "естественная" текстовая форма
//
// ==============================================================================

#ifndef FACTFORGE_VALUE_HPP
#define FACTFORGE_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace factforge {

class Fact;

/// Материализованный факт (общий для обеих стратегий)
using FactPtr = std::shared_ptr<Fact>;

// ----------------------------------------------------------------------------
// Value - каноническая модель значения
// ----------------------------------------------------------------------------
//
// Int и UInt разделены явно (как их различает RapidJSON);
// Object использует hash map (неупорядоченный);
// Fact - вложенный материализованный объект (поле object-reference).
//

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта (map string -> Value)
using ValueObject = std::unordered_map<std::string, Value>;

/// Каноническое представление значения
class Value {
public:
    // Внутренние типы для variant
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

    /// Дискриминатор для сообщений об ошибках и диспетчеризации
    enum class Kind { Null, Bool, Int, UInt, Double, String, Array, Object, Fact };

private:
    using Data = std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                              std::shared_ptr<Object>, FactPtr>;

    Data data_;

    static Data deep_copy(const Data& data);

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}

    explicit Value(bool v) : data_(v) {}

    explicit Value(std::int64_t v) : data_(v) {}

    explicit Value(std::uint64_t v) : data_(v) {}

    explicit Value(double v) : data_(v) {}

    explicit Value(std::string v) : data_(std::move(v)) {}

    explicit Value(const char* v) : data_(std::string(v)) {}

    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}

    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    /// Вложенный факт (nullptr превращается в Null)
    explicit Value(FactPtr fact) {
        if (fact) {
            data_ = std::move(fact);
        }
    }

    // Копия массива и объекта глубокая: факт не разделяет хранилище
    // со входными данными и с копиями, возвращёнными из get().
    // Вложенные факты разделяются (FactPtr).
    Value(const Value& other) : data_(deep_copy(other.data_)) {}

    Value& operator=(const Value& other) {
        if (this != &other) {
            data_ = deep_copy(other.data_);
        }
        return *this;
    }

    Value(Value&&) noexcept = default;
    Value& operator=(Value&&) noexcept = default;
    ~Value() = default;

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_null() { return Value(); }
    static Value make_bool(bool v) { return Value(v); }
    static Value make_int(std::int64_t v) { return Value(v); }
    static Value make_uint(std::uint64_t v) { return Value(v); }
    static Value make_double(double v) { return Value(v); }
    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }
    static Value make_fact(FactPtr fact) { return Value(std::move(fact)); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }
    bool is_fact() const { return std::holds_alternative<FactPtr>(data_); }

    /// Целое число (int или uint)
    bool is_integer() const { return is_int() || is_uint(); }

    /// Проверка на числовой тип (int, uint или double)
    bool is_number() const { return is_int() || is_uint() || is_double(); }

    /// Скаляр: bool, число или строка
    bool is_scalar() const { return is_bool() || is_number() || is_string(); }

    // -------------------------------------------------------------------------
    // Доступ к значению
    // -------------------------------------------------------------------------

    /// Получить bool значение (undefined behavior если не is_bool())
    Bool as_bool() const { return std::get<Bool>(data_); }

    /// Получить int64 значение (undefined behavior если не is_int())
    Int64 as_int() const { return std::get<Int64>(data_); }

    /// Получить uint64 значение (undefined behavior если не is_uint())
    UInt64 as_uint() const { return std::get<UInt64>(data_); }

    /// Получить double значение (undefined behavior если не is_double())
    Double as_double() const { return std::get<Double>(data_); }

    /// Получить string значение (undefined behavior если не is_string())
    const String& as_string() const { return std::get<String>(data_); }

    /// Получить array (undefined behavior если не is_array())
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }

    /// Получить array для модификации
    Array& as_array_mut() { return *std::get<std::shared_ptr<Array>>(data_); }

    /// Получить object (undefined behavior если не is_object())
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    /// Получить object для модификации
    Object& as_object_mut() { return *std::get<std::shared_ptr<Object>>(data_); }

    /// Получить вложенный факт (undefined behavior если не is_fact())
    const FactPtr& as_fact() const { return std::get<FactPtr>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (возвращает nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Bool* get_bool() const { return std::get_if<Bool>(&data_); }
    const Int64* get_int() const { return std::get_if<Int64>(&data_); }
    const UInt64* get_uint() const { return std::get_if<UInt64>(&data_); }
    const Double* get_double() const { return std::get_if<Double>(&data_); }
    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Fact* get_fact() const {
        auto* ptr = std::get_if<FactPtr>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    /// Добавить элемент в массив (только если is_array())
    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    /// Доступ к элементу массива по индексу
    const Value* at(std::size_t index) const {
        if (const auto* arr = get_array()) {
            if (index < arr->size()) {
                return &(*arr)[index];
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле объекта (только если is_object())
    void set(const std::string& key, Value v) {
        if (auto* obj = get_object_mut()) {
            (*obj)[key] = std::move(v);
        }
    }

    /// Получить поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Проверить наличие ключа в объекте
    bool has(const std::string& key) const {
        if (const auto* obj = get_object()) {
            return obj->find(key) != obj->end();
        }
        return false;
    }

    /// Удалить ключ из объекта; true если ключ был
    bool erase(const std::string& key) {
        if (auto* obj = get_object_mut()) {
            return obj->erase(key) > 0;
        }
        return false;
    }

    /// Размер объекта (0 если не объект)
    std::size_t object_size() const {
        if (const auto* obj = get_object()) {
            return obj->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // Равенство, хеш, текст
    // -------------------------------------------------------------------------

    /// Структурное равенство.
    /// Int и UInt равны, если равны математически; факты сравниваются по значению.
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    /// Хеш, согласованный с operator==
    std::size_t hash() const;

    /// Естественная текстовая форма: 42, 2.5, 25.0, true, null, [a, b], {k=v}
    std::string to_text() const;

    /// Имя типа для сообщений об ошибках ("integer", "string", ...)
    const char* type_name() const;

    // -------------------------------------------------------------------------
    // Конверсия из/в RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value (Number → UInt → Int → Float)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value (факты выводятся как объект полей)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Создать новый RapidJSON Document из этого Value
    rapidjson::Document to_rapidjson_document() const;

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

/// Текстовая форма double: кратчайшее представление, целые с суффиксом ".0"
std::string format_double(double d);

/// Комбинирование хешей (boost::hash_combine)
inline void hash_combine(std::size_t& seed, std::size_t h) {
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace factforge

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // FACTFORGE_VALUE_HPP
