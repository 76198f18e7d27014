// ==============================================================================
// factforge/proxy.hpp - Стратегия динамической диспетчеризации
// ==============================================================================
//
// Назначение:
// - ProxyFact: факт поверх упорядоченного набора значений полей
// - Ответы на getX/isX/setX/toString/equals/hashCode по имени метода
// - ProxyMaterializer: создание без компиляции (всегда доступен)
//
// ==============================================================================

#ifndef FACTFORGE_PROXY_HPP
#define FACTFORGE_PROXY_HPP

#include <factforge/fact.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace factforge {

class ProxyFact : public Fact {
public:
    explicit ProxyFact(std::shared_ptr<const ObjectSchema> schema);

    Strategy strategy() const override { return Strategy::Proxy; }

    const Value& get(std::string_view field) const override;
    void set(std::string_view field, Value value) override;

    /// getX/isX без аргументов, setX(value), toString, equals(other), hashCode
    Value invoke(std::string_view method, const std::vector<Value>& args = {}) override;

private:
    /// Поле по имени из аксессора ("Name" -> name); -1 если нет
    int resolve_accessor_field(std::string_view suffix) const;

    std::vector<Value> values_;  // в порядке полей схемы
};

class ProxyMaterializer {
public:
    /// Экземпляр по приведённым значениям полей
    FactPtr materialize(const std::shared_ptr<const ObjectSchema>& schema,
                        const ValueObject& values) const;
};

}  // namespace factforge

#endif  // FACTFORGE_PROXY_HPP
