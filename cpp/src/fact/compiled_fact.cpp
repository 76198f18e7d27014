// ==============================================================================
// compiled_fact.cpp - Экземпляр скомпилированного типа
// ==============================================================================

#include <factforge/coercion.hpp>
#include <factforge/error.hpp>
#include <factforge/materializer.hpp>

namespace factforge {

CompiledFact::CompiledFact(std::shared_ptr<const ObjectSchema> schema,
                           std::shared_ptr<const CompiledType> type)
    : Fact(std::move(schema)), type_(std::move(type)), slots_(type_->new_instance()) {}

std::size_t CompiledFact::slot_for(std::string_view field) const {
    require_field(field);
    int index = type_->slot_index(field);
    if (index < 0) {
        throw FieldNotFoundError(schema_name(), std::string(field));
    }
    return static_cast<std::size_t>(index);
}

const Value& CompiledFact::get(std::string_view field) const {
    return slots_[slot_for(field)];
}

void CompiledFact::set(std::string_view field, Value value) {
    const FieldSpec& spec = require_field(field);
    // null в сеттере очищает поле, значение по умолчанию не подставляется
    write(spec.setter_name(), value.is_null() ? Value() : coerce(value, spec));
}

void CompiledFact::write(std::string_view setter, Value value) {
    const Accessor* acc = type_->accessor(setter);
    if (acc == nullptr || acc->kind != Accessor::Kind::Setter) {
        throw MaterializationError(MaterializationError::Kind::InstantiationFailed,
                                   "type '" + type_->name() + "' has no setter '" +
                                       std::string(setter) + "'");
    }
    const Slot& slot = type_->slots()[acc->slot];
    if (!slot.accepts(value)) {
        throw MaterializationError(MaterializationError::Kind::InstantiationFailed,
                                   "value " + value.to_text() + " (" + value.type_name() +
                                       ") does not fit slot '" + slot.name + "' of type " +
                                       factforge::to_string(slot.type));
    }
    slots_[acc->slot] = std::move(value);
}

Value CompiledFact::invoke(std::string_view method, const std::vector<Value>& args) {
    if (const Accessor* acc = type_->accessor(method)) {
        const Slot& slot = type_->slots()[acc->slot];
        if (acc->kind == Accessor::Kind::Getter && args.empty()) {
            return slots_[acc->slot];
        }
        if (acc->kind == Accessor::Kind::Setter && args.size() == 1) {
            set(slot.name, args[0]);
            return Value();
        }
        throw UnsupportedOperationError(std::string(method),
                                        "wrong number of arguments for '" + std::string(method) +
                                            "' on " + schema_name());
    }

    if (type_->has_object_method(method)) {
        if (auto result = invoke_object_method(method, args)) {
            return *result;
        }
    }
    throw UnsupportedOperationError(std::string(method), "unsupported method '" +
                                                             std::string(method) + "' on " +
                                                             schema_name());
}

}  // namespace factforge
