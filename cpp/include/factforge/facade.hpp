// ==============================================================================
// factforge/facade.hpp - Фасад материализации JSON в факты
// ==============================================================================
//
// Назначение:
// - Разбор JSON (RapidJSON), объект или массив объектов
// - Выбор схемы: явное имя или дискриминатор (по умолчанию "_type")
// - Приведение полей, проверка обязательных, рекурсия по вложенным схемам
// - Выбор стратегии (compiled/proxy) и единственный fallback при
//   недоступном компиляторе
// - Пакетный режим с изоляцией ошибок по позиции элемента
//
// ==============================================================================

#ifndef FACTFORGE_FACADE_HPP
#define FACTFORGE_FACADE_HPP

#include <factforge/coercion.hpp>
#include <factforge/config.hpp>
#include <factforge/fact.hpp>
#include <factforge/materializer.hpp>
#include <factforge/output.hpp>
#include <factforge/proxy.hpp>
#include <factforge/registry.hpp>

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace factforge {

struct FacadeOptions {
    Strategy strategy = Strategy::Compiled;
    bool fallback_to_proxy = true;
    std::string discriminator = "_type";
    std::string ns;
};

/// Результат материализации одного элемента пакета
struct ElementResult {
    std::size_t index = 0;
    FactPtr fact;
    std::exception_ptr error;

    explicit operator bool() const { return fact != nullptr; }

    /// Текст ошибки (пусто при успехе)
    std::string error_message() const;
};

class MaterializationFacade : public NestedMaterializer {
public:
    /// registry == nullptr - собственный пустой реестр;
    /// compiler == nullptr - встроенный LayoutCompiler
    explicit MaterializationFacade(std::shared_ptr<SchemaRegistry> registry = nullptr,
                                   FacadeOptions options = {},
                                   std::shared_ptr<const TypeCompiler> compiler = nullptr,
                                   output::Writer* writer = nullptr);

    /// Фасад по конфигурации: настройки, журнал, определения.
    /// @throw std::invalid_argument при ошибке в definitions
    static std::unique_ptr<MaterializationFacade> from_config(
        const Config& config, std::shared_ptr<const TypeCompiler> compiler = nullptr);

    // JSON
    // -------------------------------------------------------------------------

    /// Все элементы по схеме schema_name; первая ошибка с позицией элемента
    /// @throw JsonParseError, ValidationError, SchemaNotFoundError, CoercionError,
    ///        MaterializationError
    std::vector<FactPtr> from_json(std::string_view json, const std::string& schema_name);

    /// Схема каждого элемента по дискриминатору
    std::vector<FactPtr> from_json_auto_detect(std::string_view json);

    /// По одному результату на элемент; ошибки не прерывают пакет
    /// @throw JsonParseError
    std::vector<ElementResult> from_json_each(std::string_view json,
                                              const std::string& schema_name);

    std::vector<ElementResult> from_json_auto_detect_each(std::string_view json);

    // Уже разобранные значения
    // -------------------------------------------------------------------------

    FactPtr from_value(const Value& value, const std::string& schema_name);
    FactPtr from_value_auto_detect(const Value& value);

    /// Материализация по map полей
    FactPtr materialize(const std::string& schema_name, const ValueObject& fields);

    /// NestedMaterializer: вложенные object-reference поля
    FactPtr materialize_nested(const std::string& schema_name, const Value& fields) override;

    // Схемы
    // -------------------------------------------------------------------------

    /// Регистрация с инвалидацией скомпилированного типа этого имени
    std::optional<Definition> register_schema(std::string_view name, std::string_view kind,
                                              std::string_view text);
    std::optional<Definition> register_schema(ObjectSchema schema);

    /// Загрузка документа определений
    std::size_t load_definitions(std::string_view document);

    /// Документ определений реестра с package из options().ns
    std::string declarative_text() const;

    SchemaRegistry& registry() { return *registry_; }
    const FacadeOptions& options() const { return options_; }
    ClassMaterializer& class_materializer() { return class_materializer_; }
    output::Writer& writer() { return *writer_; }

private:
    /// Элемент пакета; schema_name == nullptr - по дискриминатору
    FactPtr materialize_element(const Value& element, const std::string* schema_name);

    FactPtr instantiate(const std::shared_ptr<const ObjectSchema>& schema,
                        const ValueObject& values);

    std::vector<FactPtr> collect(const Value& root, const std::string* schema_name);
    std::vector<ElementResult> collect_each(const Value& root, const std::string* schema_name);

    void note_fallback(const std::string& reason);

    std::unique_ptr<output::Writer> owned_writer_;
    output::Writer* writer_;
    std::shared_ptr<SchemaRegistry> registry_;
    FacadeOptions options_;
    ClassMaterializer class_materializer_;
    ProxyMaterializer proxy_materializer_;
    std::atomic<bool> fallback_logged_{false};
};

/// Разбор JSON-текста в Value
/// @throw JsonParseError (с offset) при синтаксической ошибке
Value parse_json(std::string_view json);

}  // namespace factforge

#endif  // FACTFORGE_FACADE_HPP
