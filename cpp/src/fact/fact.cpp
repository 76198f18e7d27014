// ==============================================================================
// fact.cpp - Общая часть фактов (равенство, хеш, toString, поиск по пути)
// ==============================================================================

#include <factforge/error.hpp>
#include <factforge/fact.hpp>

#include <functional>

namespace factforge {

const char* to_string(Strategy strategy) {
    switch (strategy) {
    case Strategy::Compiled:
        return "compiled";
    case Strategy::Proxy:
        return "proxy";
    }
    return "unknown";
}

Fact::Fact(std::shared_ptr<const ObjectSchema> schema) : schema_(std::move(schema)) {}

std::vector<std::pair<std::string, Value>> Fact::fields() const {
    std::vector<std::pair<std::string, Value>> out;
    out.reserve(schema_->field_count());
    for (const auto& f : schema_->fields()) {
        out.emplace_back(f.name, get(f.name));
    }
    return out;
}

// ----------------------------------------------------------------------------
// find - поиск по dot-path
// ----------------------------------------------------------------------------

std::optional<Value> Fact::find(std::string_view path) const {
    if (path.empty()) {
        return std::nullopt;
    }

    auto dot = path.find('.');
    std::string_view head = path.substr(0, dot);
    if (!schema_->has_field(head)) {
        return std::nullopt;
    }

    Value current = get(head);
    while (dot != std::string_view::npos) {
        path = path.substr(dot + 1);
        dot = path.find('.');
        std::string key(path.substr(0, dot));

        if (const Fact* nested = current.get_fact()) {
            if (!nested->schema().has_field(key)) {
                return std::nullopt;
            }
            current = nested->get(key);
        } else if (const Value* v = current.get(key)) {
            current = *v;
        } else {
            return std::nullopt;
        }
    }
    return current;
}

// ----------------------------------------------------------------------------
// Равенство / хеш / toString
// ----------------------------------------------------------------------------

bool Fact::equals(const Fact& other) const {
    if (this == &other) {
        return true;
    }
    if (schema_name() != other.schema_name()) {
        return false;
    }

    const auto& mine = schema_->fields();
    const auto& theirs = other.schema().fields();
    if (mine.size() != theirs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < mine.size(); ++i) {
        if (mine[i].name != theirs[i].name) {
            return false;
        }
        if (get(mine[i].name) != other.get(theirs[i].name)) {
            return false;
        }
    }
    return true;
}

std::size_t Fact::hash() const {
    std::size_t seed = std::hash<std::string>{}(schema_name());
    for (const auto& f : schema_->fields()) {
        hash_combine(seed, std::hash<std::string>{}(f.name));
        hash_combine(seed, get(f.name).hash());
    }
    return seed;
}

std::string Fact::to_string() const {
    std::string out = schema_name();
    out += "{";
    bool first = true;
    for (const auto& f : schema_->fields()) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += f.name;
        out += "=";
        out += get(f.name).to_text();
    }
    out += "}";
    return out;
}

// ----------------------------------------------------------------------------
// invoke: общие методы
// ----------------------------------------------------------------------------

std::optional<Value> Fact::invoke_object_method(std::string_view method,
                                                const std::vector<Value>& args) const {
    if (method == "toString" && args.empty()) {
        return Value(to_string());
    }
    if (method == "hashCode" && args.empty()) {
        return Value(static_cast<std::uint64_t>(hash()));
    }
    if (method == "equals" && args.size() == 1) {
        const Fact* other = args[0].get_fact();
        return Value(other != nullptr && equals(*other));
    }
    return std::nullopt;
}

const FieldSpec& Fact::require_field(std::string_view field) const {
    const FieldSpec* spec = schema_->field(field);
    if (spec == nullptr) {
        throw FieldNotFoundError(schema_name(), std::string(field));
    }
    return *spec;
}

}  // namespace factforge
