// ==============================================================================
// factforge/registry.hpp - Реестр определений и схем
// ==============================================================================
//
// Назначение:
// - Хранение именованных определений (declare/import/global/function/...)
// - Разбор declare в ObjectSchema при регистрации
// - Выборка по виду, обратная сериализация в декларативный текст
// - Ревизия на каждую регистрацию (для инвалидации скомпилированных типов)
//
// Потокобезопасность: std::shared_mutex, чтения не блокируют друг друга.
//
// ==============================================================================

#ifndef FACTFORGE_REGISTRY_HPP
#define FACTFORGE_REGISTRY_HPP

#include <factforge/schema.hpp>
#include <factforge/schema_text.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace factforge {

/// Вид определения с разобранной схемой
inline constexpr const char* kDeclareKind = "declare";

struct Definition {
    std::string name;
    std::string kind;     // в нижнем регистре
    std::string content;  // исходный текст (trimmed)

    /// Только для kind == declare
    std::shared_ptr<const ObjectSchema> schema;

    std::uint64_t revision = 0;

    bool is_declare() const { return kind == kDeclareKind; }
};

class SchemaRegistry {
public:
    SchemaRegistry() = default;

    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    /// Зарегистрировать (или заменить) определение.
    /// @return заменённое определение
    /// @throw std::invalid_argument пустые аргументы, ошибка разбора declare,
    ///        несовпадение имени в declare с name
    std::optional<Definition> add(std::string_view name, std::string_view kind,
                                  std::string_view text);

    /// Программная регистрация схемы; текст определения - render_declare
    std::optional<Definition> add_schema(ObjectSchema schema);

    /// Регистрация нескольких блоков (все или ничего)
    /// @return заменённые определения
    std::vector<Definition> add_definitions(const std::vector<DefinitionBlock>& blocks);

    /// Разбор документа и регистрация всех блоков (все или ничего).
    /// package документа становится namespace объявленных схем.
    /// @return число зарегистрированных определений
    std::size_t load(std::string_view document);

    /// Схема declare-определения; nullptr если нет
    std::shared_ptr<const ObjectSchema> get(std::string_view name) const;

    std::optional<Definition> find_definition(std::string_view name) const;

    /// @return удалённое определение
    std::optional<Definition> remove(std::string_view name);

    /// Определения вида kind (без учёта регистра), по имени
    std::vector<Definition> list_by_kind(std::string_view kind) const;

    std::size_t count() const;
    std::vector<std::string> names() const;
    bool contains(std::string_view name) const;
    void clear();

    /// Количество определений по видам
    std::string summary() const;

    /// Полный документ: package, импорты, globals, типы, функции, прочие виды
    std::string to_declarative_text(const std::optional<std::string>& ns = std::nullopt) const;

private:
    /// Проверка и подготовка определения без изменения реестра
    static Definition prepare(std::string_view name, std::string_view kind, std::string_view text,
                              const std::string& ns = {});

    /// Вставка под эксклюзивной блокировкой
    std::optional<Definition> insert_locked(Definition def);

    mutable std::shared_mutex mutex_;
    std::map<std::string, Definition, std::less<>> definitions_;
    std::uint64_t next_revision_ = 0;
};

}  // namespace factforge

#endif  // FACTFORGE_REGISTRY_HPP
