// ==============================================================================
// facade.cpp - Фасад материализации JSON в факты
// ==============================================================================

#include <factforge/error.hpp>
#include <factforge/facade.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace factforge {

// ----------------------------------------------------------------------------
// parse_json
// ----------------------------------------------------------------------------

Value parse_json(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        std::size_t offset = doc.GetErrorOffset();
        throw JsonParseError(std::string("invalid JSON at offset ") + std::to_string(offset) +
                                 ": " + rapidjson::GetParseError_En(doc.GetParseError()),
                             offset);
    }
    return Value::from_rapidjson(doc);
}

std::string ElementResult::error_message() const {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

// ----------------------------------------------------------------------------
// Конструирование
// ----------------------------------------------------------------------------

MaterializationFacade::MaterializationFacade(std::shared_ptr<SchemaRegistry> registry,
                                             FacadeOptions options,
                                             std::shared_ptr<const TypeCompiler> compiler,
                                             output::Writer* writer)
    : writer_(writer != nullptr ? writer : &output::quiet_writer()),
      registry_(registry ? std::move(registry) : std::make_shared<SchemaRegistry>()),
      options_(std::move(options)),
      class_materializer_(std::move(compiler), writer_) {
    if (options_.discriminator.empty()) {
        throw std::invalid_argument("discriminator cannot be empty");
    }
}

std::unique_ptr<MaterializationFacade> MaterializationFacade::from_config(
    const Config& config, std::shared_ptr<const TypeCompiler> compiler) {
    auto writer = std::make_unique<output::Writer>(config.log);

    FacadeOptions options;
    options.strategy = config.strategy;
    options.fallback_to_proxy = config.fallback_to_proxy;
    options.discriminator = config.discriminator;
    options.ns = config.ns;

    auto facade = std::make_unique<MaterializationFacade>(nullptr, std::move(options),
                                                          std::move(compiler), writer.get());
    facade->owned_writer_ = std::move(writer);

    if (!config.definitions.empty()) {
        std::size_t n = facade->load_definitions(config.definitions);
        facade->writer_->info("loaded " + std::to_string(n) + " definitions");
    }
    return facade;
}

// ----------------------------------------------------------------------------
// Схемы
// ----------------------------------------------------------------------------

std::optional<Definition> MaterializationFacade::register_schema(std::string_view name,
                                                                 std::string_view kind,
                                                                 std::string_view text) {
    auto previous = registry_->add(name, kind, text);
    class_materializer_.invalidate(std::string(trim(name)));
    return previous;
}

std::optional<Definition> MaterializationFacade::register_schema(ObjectSchema schema) {
    std::string name = schema.name();
    auto previous = registry_->add_schema(std::move(schema));
    class_materializer_.invalidate(name);
    return previous;
}

std::size_t MaterializationFacade::load_definitions(std::string_view document) {
    std::size_t n = registry_->load(document);
    for (const auto& def : registry_->list_by_kind(kDeclareKind)) {
        class_materializer_.invalidate(def.name);
    }
    return n;
}

std::string MaterializationFacade::declarative_text() const {
    if (options_.ns.empty()) {
        return registry_->to_declarative_text();
    }
    return registry_->to_declarative_text(options_.ns);
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

std::vector<FactPtr> MaterializationFacade::from_json(std::string_view json,
                                                      const std::string& schema_name) {
    return collect(parse_json(json), &schema_name);
}

std::vector<FactPtr> MaterializationFacade::from_json_auto_detect(std::string_view json) {
    return collect(parse_json(json), nullptr);
}

std::vector<ElementResult> MaterializationFacade::from_json_each(std::string_view json,
                                                                 const std::string& schema_name) {
    return collect_each(parse_json(json), &schema_name);
}

std::vector<ElementResult> MaterializationFacade::from_json_auto_detect_each(
    std::string_view json) {
    return collect_each(parse_json(json), nullptr);
}

std::vector<FactPtr> MaterializationFacade::collect(const Value& root,
                                                    const std::string* schema_name) {
    std::vector<FactPtr> facts;
    if (root.is_object()) {
        facts.push_back(materialize_element(root, schema_name));
        return facts;
    }
    if (!root.is_array()) {
        throw JsonParseError(std::string("top-level JSON value must be an object or an array, got ") +
                             root.type_name());
    }

    const auto& elements = root.as_array();
    facts.reserve(elements.size());
    for (std::size_t i = 0; i < elements.size(); ++i) {
        try {
            facts.push_back(materialize_element(elements[i], schema_name));
        } catch (Error& e) {
            e.set_element_index(i);
            throw;
        }
    }
    writer_->debug("materialized " + std::to_string(facts.size()) + " facts");
    return facts;
}

std::vector<ElementResult> MaterializationFacade::collect_each(const Value& root,
                                                               const std::string* schema_name) {
    if (!root.is_object() && !root.is_array()) {
        throw JsonParseError(std::string("top-level JSON value must be an object or an array, got ") +
                             root.type_name());
    }

    ValueArray single;
    const ValueArray* elements = root.get_array();
    if (elements == nullptr) {
        single.push_back(root);
        elements = &single;
    }

    std::vector<ElementResult> results;
    results.reserve(elements->size());
    std::size_t failed = 0;
    for (std::size_t i = 0; i < elements->size(); ++i) {
        ElementResult r;
        r.index = i;
        try {
            r.fact = materialize_element((*elements)[i], schema_name);
        } catch (Error& e) {
            e.set_element_index(i);
            r.error = std::current_exception();
            writer_->debug("element " + std::to_string(i) + " failed: " + e.what());
            ++failed;
        }
        results.push_back(std::move(r));
    }
    if (failed > 0) {
        writer_->warn(std::to_string(failed) + " of " + std::to_string(results.size()) +
                      " elements failed to materialize");
    }
    return results;
}

// ----------------------------------------------------------------------------
// Материализация
// ----------------------------------------------------------------------------

FactPtr MaterializationFacade::from_value(const Value& value, const std::string& schema_name) {
    return materialize_element(value, &schema_name);
}

FactPtr MaterializationFacade::from_value_auto_detect(const Value& value) {
    return materialize_element(value, nullptr);
}

FactPtr MaterializationFacade::materialize(const std::string& schema_name,
                                           const ValueObject& fields) {
    return materialize_element(Value(fields), &schema_name);
}

FactPtr MaterializationFacade::materialize_nested(const std::string& schema_name,
                                                  const Value& fields) {
    return materialize_element(fields, &schema_name);
}

FactPtr MaterializationFacade::materialize_element(const Value& element,
                                                   const std::string* schema_name) {
    const ValueObject* object = element.get_object();
    if (object == nullptr) {
        throw ValidationError(std::string("element must be a JSON object, got ") +
                              element.type_name());
    }

    // Имя схемы: явное или по дискриминатору
    std::string name;
    const Value* tag = element.get(options_.discriminator);
    if (schema_name != nullptr) {
        name = *schema_name;
        if (tag != nullptr && !tag->is_null() && tag->to_text() != name) {
            writer_->warn("discriminator '" + tag->to_text() + "' ignored, materializing as " +
                          name);
        }
    } else {
        if (tag == nullptr || !tag->is_string() || tag->as_string().empty()) {
            throw SchemaNotFoundError(tag == nullptr ? std::string() : tag->to_text());
        }
        name = tag->as_string();
    }

    auto schema = registry_->get(name);
    if (!schema) {
        throw SchemaNotFoundError(name);
    }

    if (writer_->enabled(output::Level::Trace)) {
        for (const auto& [key, value] : *object) {
            if (key != options_.discriminator && !schema->has_field(key)) {
                writer_->trace("ignoring unknown key '" + key + "' for " + name);
            }
        }
    }

    // Приведение всех полей схемы; отсутствующие ключи как null
    ValueObject coerced;
    const Value null_value;
    for (const auto& field : schema->fields()) {
        auto it = field.name == options_.discriminator ? object->end() : object->find(field.name);
        const Value& raw = it == object->end() ? null_value : it->second;
        coerced.emplace(field.name, coerce(raw, field, this));
    }

    auto missing = schema->missing_required(coerced);
    if (!missing.empty()) {
        throw ValidationError(name, std::move(missing));
    }

    return instantiate(schema, coerced);
}

FactPtr MaterializationFacade::instantiate(const std::shared_ptr<const ObjectSchema>& schema,
                                           const ValueObject& values) {
    if (options_.strategy == Strategy::Proxy) {
        return proxy_materializer_.materialize(schema, values);
    }

    if (!class_materializer_.available() && options_.fallback_to_proxy) {
        note_fallback("type compiler '" + class_materializer_.compiler().name() +
                      "' is not available");
        return proxy_materializer_.materialize(schema, values);
    }

    try {
        return class_materializer_.materialize(schema, values);
    } catch (const MaterializationError& e) {
        if (!e.compiler_unavailable() || !options_.fallback_to_proxy) {
            throw;
        }
        note_fallback(e.what());
    }
    return proxy_materializer_.materialize(schema, values);
}

void MaterializationFacade::note_fallback(const std::string& reason) {
    if (!fallback_logged_.exchange(true)) {
        writer_->warn(reason + ", falling back to proxy facts");
    }
}

}  // namespace factforge
