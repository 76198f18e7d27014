// ==============================================================================
// proxy.cpp - Факты с диспетчеризацией по имени метода
// ==============================================================================

#include <factforge/coercion.hpp>
#include <factforge/error.hpp>
#include <factforge/proxy.hpp>

namespace factforge {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() > prefix.size() && s.substr(0, prefix.size()) == prefix;
}

}  // namespace

ProxyFact::ProxyFact(std::shared_ptr<const ObjectSchema> schema)
    : Fact(std::move(schema)), values_(schema_->field_count()) {}

const Value& ProxyFact::get(std::string_view field) const {
    auto index = schema_->index_of(field);
    if (!index) {
        throw FieldNotFoundError(schema_name(), std::string(field));
    }
    return values_[*index];
}

void ProxyFact::set(std::string_view field, Value value) {
    const FieldSpec& spec = require_field(field);
    // null в сеттере очищает поле, значение по умолчанию не подставляется
    values_[*schema_->index_of(field)] = value.is_null() ? Value() : coerce(value, spec);
}

int ProxyFact::resolve_accessor_field(std::string_view suffix) const {
    // getFirstName -> firstName, затем точное FirstName
    if (auto index = schema_->index_of(decapitalize(suffix))) {
        return static_cast<int>(*index);
    }
    if (auto index = schema_->index_of(suffix)) {
        return static_cast<int>(*index);
    }
    return -1;
}

Value ProxyFact::invoke(std::string_view method, const std::vector<Value>& args) {
    if (auto result = invoke_object_method(method, args)) {
        return *result;
    }

    std::string_view suffix;
    bool getter = false;
    if (args.empty() && starts_with(method, "get")) {
        suffix = method.substr(3);
        getter = true;
    } else if (args.empty() && starts_with(method, "is")) {
        suffix = method.substr(2);
        getter = true;
    } else if (args.size() == 1 && starts_with(method, "set")) {
        suffix = method.substr(3);
    } else {
        throw UnsupportedOperationError(std::string(method), "unsupported method '" +
                                                                 std::string(method) + "' on " +
                                                                 schema_name());
    }

    int index = resolve_accessor_field(suffix);
    if (index < 0) {
        throw UnsupportedOperationError(std::string(method),
                                        "no field for accessor '" + std::string(method) +
                                            "' on " + schema_name());
    }

    const FieldSpec& spec = schema_->fields()[static_cast<std::size_t>(index)];
    if (getter) {
        return values_[static_cast<std::size_t>(index)];
    }
    set(spec.name, args[0]);
    return Value();
}

// ----------------------------------------------------------------------------
// ProxyMaterializer
// ----------------------------------------------------------------------------

FactPtr ProxyMaterializer::materialize(const std::shared_ptr<const ObjectSchema>& schema,
                                       const ValueObject& values) const {
    auto fact = std::make_shared<ProxyFact>(schema);
    for (const auto& field : schema->fields()) {
        auto it = values.find(field.name);
        // Значения уже приведены фасадом; повторное приведение идемпотентно.
        // Отсутствующий ключ получает значение по умолчанию поля
        fact->set(field.name, coerce(it == values.end() ? Value() : it->second, field));
    }
    return fact;
}

}  // namespace factforge
