// ==============================================================================
// factforge/materializer.hpp - Стратегия скомпилированных типов
// ==============================================================================
//
// Назначение:
// - CompiledFact: экземпляр скомпилированного типа (слоты + таблица аксессоров)
// - TypeCache: кэш скомпилированных типов по имени схемы и ревизии
// - ClassMaterializer: генерация исходника, компиляция, создание экземпляров
//
// Ошибки компиляции никогда не скрываются: MaterializationError с исходным
// текстом и диагностикой. Кэш не глобальный - принадлежит материализатору.
//
// ==============================================================================

#ifndef FACTFORGE_MATERIALIZER_HPP
#define FACTFORGE_MATERIALIZER_HPP

#include <factforge/compiler.hpp>
#include <factforge/fact.hpp>
#include <factforge/output.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace factforge {

// ----------------------------------------------------------------------------
// CompiledFact
// ----------------------------------------------------------------------------

class CompiledFact : public Fact {
public:
    CompiledFact(std::shared_ptr<const ObjectSchema> schema,
                 std::shared_ptr<const CompiledType> type);

    Strategy strategy() const override { return Strategy::Compiled; }

    const Value& get(std::string_view field) const override;
    void set(std::string_view field, Value value) override;

    /// Только методы таблицы аксессоров и объявленные toString/equals/hashCode
    Value invoke(std::string_view method, const std::vector<Value>& args = {}) override;

    /// Запись уже приведённого значения через скомпилированный setter
    /// @throw MaterializationError (InstantiationFailed)
    void write(std::string_view setter, Value value);

    const CompiledType& type() const { return *type_; }

private:
    std::size_t slot_for(std::string_view field) const;

    std::shared_ptr<const CompiledType> type_;
    std::vector<Value> slots_;
};

// ----------------------------------------------------------------------------
// TypeCache
// ----------------------------------------------------------------------------

class TypeCache {
public:
    /// Тип для схемы name ревизии revision; nullptr если нет или устарел
    std::shared_ptr<const CompiledType> find(const std::string& name,
                                             std::uint64_t revision) const;

    /// Сохранить тип; запись более новой ревизии не вытесняется старой
    void store(const std::string& name, std::uint64_t revision,
               std::shared_ptr<const CompiledType> type);

    /// @return true если запись была
    bool invalidate(const std::string& name);

    void clear();
    std::size_t size() const;
    bool contains(const std::string& name) const;

private:
    struct Entry {
        std::uint64_t revision = 0;
        std::shared_ptr<const CompiledType> type;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

// ----------------------------------------------------------------------------
// ClassMaterializer
// ----------------------------------------------------------------------------

class ClassMaterializer {
public:
    /// compiler == nullptr - встроенный LayoutCompiler
    explicit ClassMaterializer(std::shared_ptr<const TypeCompiler> compiler = nullptr,
                               output::Writer* writer = nullptr);

    /// Доступен ли компилятор
    bool available() const { return compiler_->available(); }

    const TypeCompiler& compiler() const { return *compiler_; }

    /// Скомпилированный тип схемы (из кэша или после компиляции)
    /// @throw MaterializationError
    std::shared_ptr<const CompiledType> compiled_type(const ObjectSchema& schema);

    /// Экземпляр по приведённым значениям полей
    /// @throw MaterializationError
    FactPtr materialize(const std::shared_ptr<const ObjectSchema>& schema,
                        const ValueObject& values);

    /// Сбросить скомпилированный тип схемы
    void invalidate(const std::string& schema_name);

    TypeCache& cache() { return cache_; }
    const TypeCache& cache() const { return cache_; }

    /// Число вызовов компилятора
    std::size_t compile_count() const { return compile_count_.load(); }

private:
    std::shared_ptr<const TypeCompiler> compiler_;
    output::Writer* writer_;
    TypeCache cache_;
    std::atomic<std::size_t> compile_count_{0};
};

}  // namespace factforge

#endif  // FACTFORGE_MATERIALIZER_HPP
