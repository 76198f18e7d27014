// ==============================================================================
// factforge/fact.hpp - Материализованный факт
// ==============================================================================
//
// Назначение:
// - Fact: общий интерфейс для фактов обеих стратегий
// - Контракт getter/setter для внешнего rule engine (invoke)
// - Структурное равенство/хеш/toString, не зависящие от стратегии
// - Поиск по dot-path (a.b.c) через вложенные факты и map-поля
//
// ==============================================================================

#ifndef FACTFORGE_FACT_HPP
#define FACTFORGE_FACT_HPP

#include <factforge/schema.hpp>
#include <factforge/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace factforge {

/// Стратегия материализации
enum class Strategy {
    Compiled,  // скомпилированный тип со слотами
    Proxy      // объект поверх map полей с диспетчеризацией по имени метода
};

const char* to_string(Strategy strategy);

// ----------------------------------------------------------------------------
// Fact
// ----------------------------------------------------------------------------

class Fact {
public:
    virtual ~Fact() = default;

    Fact(const Fact&) = delete;
    Fact& operator=(const Fact&) = delete;

    const ObjectSchema& schema() const { return *schema_; }
    const std::shared_ptr<const ObjectSchema>& schema_ptr() const { return schema_; }
    const std::string& schema_name() const { return schema_->name(); }

    virtual Strategy strategy() const = 0;

    /// Значение поля
    /// @throw FieldNotFoundError если поля нет в схеме
    virtual const Value& get(std::string_view field) const = 0;

    /// Записать значение поля с приведением к объявленному типу.
    /// null очищает поле (значение по умолчанию не подставляется)
    /// @throw FieldNotFoundError, CoercionError
    virtual void set(std::string_view field, Value value) = 0;

    /// Вызов метода по имени: getX/isX/setX/toString/equals/hashCode
    /// @throw UnsupportedOperationError для неизвестных методов
    virtual Value invoke(std::string_view method, const std::vector<Value>& args = {}) = 0;

    /// Пары (поле, значение) в порядке объявления в схеме
    std::vector<std::pair<std::string, Value>> fields() const;

    /// Поиск по пути "address.city" (вложенные факты и map-поля)
    std::optional<Value> find(std::string_view path) const;

    /// Равенство имени схемы и значений всех полей
    bool equals(const Fact& other) const;

    /// Хеш имени схемы и значений полей (согласован с equals)
    std::size_t hash() const;

    /// SchemaName{field1=v1, field2=v2}
    std::string to_string() const;

protected:
    explicit Fact(std::shared_ptr<const ObjectSchema> schema);

    /// Общая часть invoke: toString/equals/hashCode. nullopt - метод не из этой группы
    std::optional<Value> invoke_object_method(std::string_view method,
                                              const std::vector<Value>& args) const;

    /// Спецификация поля или FieldNotFoundError
    const FieldSpec& require_field(std::string_view field) const;

    std::shared_ptr<const ObjectSchema> schema_;
};

}  // namespace factforge

#endif  // FACTFORGE_FACT_HPP
