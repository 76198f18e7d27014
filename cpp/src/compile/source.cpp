// ==============================================================================
// source.cpp - Генерация исходного текста и скомпилированный тип
// ==============================================================================

#include <factforge/compiler.hpp>
#include <factforge/fact.hpp>
#include <factforge/schema_text.hpp>

#include <algorithm>
#include <limits>
#include <sstream>

namespace factforge {

// ----------------------------------------------------------------------------
// generate_source
// ----------------------------------------------------------------------------

std::string slot_type_name(const FieldSpec& field) {
    switch (field.type) {
    case FieldType::String:
        return "string";
    case FieldType::Integer:
        return "int32";
    case FieldType::Long:
        return "int64";
    case FieldType::Double:
        return "double";
    case FieldType::Boolean:
        return "bool";
    case FieldType::List:
        // Вложенные generic-подсказки (List<Map<K,V>>) в раскладку не попадают
        if (!field.element_type.empty() && field.element_type.find('<') == std::string::npos) {
            return "list<" + field.element_type + ">";
        }
        return "list";
    case FieldType::Map:
        return "map";
    case FieldType::Object:
        return "ref " + field.object_type;
    }
    return "string";
}

std::string generate_source(const ObjectSchema& schema) {
    std::ostringstream oss;
    oss << "class " << schema.name() << " {\n";

    const auto& fields = schema.fields();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& f = fields[i];
        oss << "    field " << i << " " << f.name << " : " << slot_type_name(f);
        // Значения по умолчанию коллекций и ссылок подставляет приведение
        if (f.is_primitive() && f.has_default()) {
            oss << " = " << render_literal(f.default_value);
        }
        oss << ";\n";
    }

    oss << "    constructor(";
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << fields[i].name;
    }
    oss << ");\n";

    for (const auto& f : fields) {
        oss << "    getter " << f.getter_name() << " -> " << f.name << ";\n";
        oss << "    setter " << f.setter_name() << " -> " << f.name << ";\n";
    }

    oss << "    method toString;\n";
    oss << "    method equals;\n";
    oss << "    method hashCode;\n";
    oss << "}\n";
    return oss.str();
}

// ----------------------------------------------------------------------------
// Slot
// ----------------------------------------------------------------------------

const char* to_string(SlotType type) {
    switch (type) {
    case SlotType::String:
        return "string";
    case SlotType::Int32:
        return "int32";
    case SlotType::Int64:
        return "int64";
    case SlotType::Double:
        return "double";
    case SlotType::Bool:
        return "bool";
    case SlotType::List:
        return "list";
    case SlotType::Map:
        return "map";
    case SlotType::Ref:
        return "ref";
    }
    return "unknown";
}

bool Slot::accepts(const Value& value) const {
    if (value.is_null()) {
        return true;
    }
    switch (type) {
    case SlotType::String:
        return value.is_string();
    case SlotType::Int32:
        if (const auto* i = value.get_int()) {
            return *i >= std::numeric_limits<std::int32_t>::min() &&
                   *i <= std::numeric_limits<std::int32_t>::max();
        }
        if (const auto* u = value.get_uint()) {
            return *u <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
        }
        return false;
    case SlotType::Int64:
        if (const auto* u = value.get_uint()) {
            return *u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        }
        return value.is_int();
    case SlotType::Double:
        return value.is_double();
    case SlotType::Bool:
        return value.is_bool();
    case SlotType::List:
        return value.is_array();
    case SlotType::Map:
        return value.is_object();
    case SlotType::Ref:
        if (const Fact* fact = value.get_fact()) {
            return fact->schema_name() == ref_type;
        }
        return false;
    }
    return false;
}

// ----------------------------------------------------------------------------
// CompiledType
// ----------------------------------------------------------------------------

CompiledType::CompiledType(std::string name, std::string source, std::vector<Slot> slots,
                           std::unordered_map<std::string, Accessor> accessors,
                           std::vector<std::string> object_methods)
    : name_(std::move(name)),
      source_(std::move(source)),
      slots_(std::move(slots)),
      accessors_(std::move(accessors)),
      object_methods_(std::move(object_methods)) {}

int CompiledType::slot_index(std::string_view field) const {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].name == field) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const Accessor* CompiledType::accessor(std::string_view method) const {
    auto it = accessors_.find(std::string(method));
    return it == accessors_.end() ? nullptr : &it->second;
}

bool CompiledType::has_object_method(std::string_view method) const {
    return std::find(object_methods_.begin(), object_methods_.end(), method) !=
           object_methods_.end();
}

std::vector<Value> CompiledType::new_instance() const {
    std::vector<Value> values;
    values.reserve(slots_.size());
    for (const auto& slot : slots_) {
        values.push_back(slot.default_value);
    }
    return values;
}

}  // namespace factforge
