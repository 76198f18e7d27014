// ==============================================================================
// registry.cpp - Реестр определений и схем
// ==============================================================================

#include <factforge/coercion.hpp>
#include <factforge/registry.hpp>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace factforge {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool is_grouped_kind(const std::string& kind) {
    return kind == "import" || kind == "global" || kind == "declare" || kind == "function";
}

}  // namespace

// ----------------------------------------------------------------------------
// Регистрация
// ----------------------------------------------------------------------------

Definition SchemaRegistry::prepare(std::string_view name, std::string_view kind,
                                   std::string_view text, const std::string& ns) {
    std::string_view n = trim(name);
    std::string_view k = trim(kind);
    std::string_view t = trim(text);
    if (n.empty()) {
        throw std::invalid_argument("definition name cannot be empty");
    }
    if (k.empty()) {
        throw std::invalid_argument("definition kind cannot be empty");
    }
    if (t.empty()) {
        throw std::invalid_argument("definition content cannot be empty");
    }

    Definition def;
    def.name = std::string(n);
    def.kind = to_lower(k);
    def.content = std::string(t);

    if (def.is_declare()) {
        ObjectSchema schema = parse_declare(t);
        if (schema.name() != def.name) {
            throw std::invalid_argument("declare name '" + schema.name() +
                                        "' does not match definition name '" + def.name + "'");
        }
        if (!ns.empty()) {
            schema.set_ns(ns);
        }
        def.schema = std::make_shared<const ObjectSchema>(std::move(schema));
    }
    return def;
}

std::optional<Definition> SchemaRegistry::insert_locked(Definition def) {
    def.revision = ++next_revision_;
    if (def.schema) {
        // Ревизия копируется в схему, которой пользуется кэш типов
        auto schema = std::make_shared<ObjectSchema>(*def.schema);
        schema->set_revision(def.revision);
        def.schema = std::move(schema);
    }

    std::optional<Definition> previous;
    auto it = definitions_.find(def.name);
    if (it != definitions_.end()) {
        previous = std::move(it->second);
        it->second = std::move(def);
    } else {
        std::string key = def.name;
        definitions_.emplace(std::move(key), std::move(def));
    }
    return previous;
}

std::optional<Definition> SchemaRegistry::add(std::string_view name, std::string_view kind,
                                              std::string_view text) {
    Definition def = prepare(name, kind, text);
    std::unique_lock lock(mutex_);
    return insert_locked(std::move(def));
}

std::optional<Definition> SchemaRegistry::add_schema(ObjectSchema schema) {
    if (schema.name().empty()) {
        throw std::invalid_argument("schema name cannot be empty");
    }
    Definition def;
    def.name = schema.name();
    def.kind = kDeclareKind;
    def.content = render_declare(schema);
    schema.set_revision(0);
    def.schema = std::make_shared<const ObjectSchema>(std::move(schema));

    std::unique_lock lock(mutex_);
    return insert_locked(std::move(def));
}

std::vector<Definition> SchemaRegistry::add_definitions(const std::vector<DefinitionBlock>& blocks) {
    std::vector<Definition> prepared;
    prepared.reserve(blocks.size());
    for (const auto& block : blocks) {
        prepared.push_back(prepare(block.name, block.kind, block.content));
    }

    std::vector<Definition> replaced;
    std::unique_lock lock(mutex_);
    for (auto& def : prepared) {
        if (auto previous = insert_locked(std::move(def))) {
            replaced.push_back(std::move(*previous));
        }
    }
    return replaced;
}

std::size_t SchemaRegistry::load(std::string_view document) {
    DefinitionDocument doc = split_definitions(document);

    std::vector<Definition> prepared;
    prepared.reserve(doc.blocks.size());
    for (const auto& block : doc.blocks) {
        try {
            prepared.push_back(prepare(block.name, block.kind, block.content, doc.package));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(block.kind + " '" + block.name + "' at line " +
                                        std::to_string(block.line) + ": " + e.what());
        }
    }

    std::unique_lock lock(mutex_);
    for (auto& def : prepared) {
        insert_locked(std::move(def));
    }
    return prepared.size();
}

// ----------------------------------------------------------------------------
// Поиск
// ----------------------------------------------------------------------------

std::shared_ptr<const ObjectSchema> SchemaRegistry::get(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = definitions_.find(trim(name));
    if (it == definitions_.end()) {
        return nullptr;
    }
    return it->second.schema;
}

std::optional<Definition> SchemaRegistry::find_definition(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = definitions_.find(trim(name));
    if (it == definitions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Definition> SchemaRegistry::remove(std::string_view name) {
    std::unique_lock lock(mutex_);
    auto it = definitions_.find(trim(name));
    if (it == definitions_.end()) {
        return std::nullopt;
    }
    Definition removed = std::move(it->second);
    definitions_.erase(it);
    return removed;
}

std::vector<Definition> SchemaRegistry::list_by_kind(std::string_view kind) const {
    std::string wanted = to_lower(trim(kind));
    std::vector<Definition> out;
    std::shared_lock lock(mutex_);
    for (const auto& [name, def] : definitions_) {
        if (def.kind == wanted) {
            out.push_back(def);
        }
    }
    return out;
}

std::size_t SchemaRegistry::count() const {
    std::shared_lock lock(mutex_);
    return definitions_.size();
}

std::vector<std::string> SchemaRegistry::names() const {
    std::vector<std::string> out;
    std::shared_lock lock(mutex_);
    out.reserve(definitions_.size());
    for (const auto& [name, def] : definitions_) {
        out.push_back(name);
    }
    return out;
}

bool SchemaRegistry::contains(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return definitions_.find(trim(name)) != definitions_.end();
}

void SchemaRegistry::clear() {
    std::unique_lock lock(mutex_);
    definitions_.clear();
}

// ----------------------------------------------------------------------------
// Текстовые представления
// ----------------------------------------------------------------------------

std::string SchemaRegistry::summary() const {
    std::shared_lock lock(mutex_);
    if (definitions_.empty()) {
        return "No definitions stored.";
    }

    std::map<std::string, std::vector<std::string>> by_kind;
    for (const auto& [name, def] : definitions_) {
        by_kind[def.kind].push_back(name);
    }

    std::ostringstream oss;
    oss << "Definitions Summary:\n";
    oss << "Total definitions: " << definitions_.size() << "\n\n";
    for (const auto& [kind, names] : by_kind) {
        oss << to_upper(kind) << " (" << names.size() << "):\n";
        for (const auto& name : names) {
            oss << "  - " << name << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

std::string SchemaRegistry::to_declarative_text(const std::optional<std::string>& ns) const {
    std::shared_lock lock(mutex_);

    // definitions_ упорядочен по имени, поэтому группы уже отсортированы
    std::map<std::string, std::vector<const Definition*>> by_kind;
    for (const auto& [name, def] : definitions_) {
        by_kind[def.kind].push_back(&def);
    }

    std::ostringstream oss;
    if (ns && !trim(*ns).empty()) {
        oss << "package " << trim(*ns) << ";\n\n";
    }

    auto emit = [&](const std::string& kind, const std::string& header, const char* separator,
                    bool trailing_blank) {
        auto it = by_kind.find(kind);
        if (it == by_kind.end()) {
            return;
        }
        oss << "// " << header << "\n";
        for (const auto* def : it->second) {
            oss << def->content << separator;
        }
        if (trailing_blank) {
            oss << "\n";
        }
    };

    emit("import", "Imports", "\n", true);
    emit("global", "Globals", "\n", true);
    emit("declare", "Declared Types", "\n\n", false);
    emit("function", "Functions", "\n\n", false);

    for (const auto& [kind, defs] : by_kind) {
        if (is_grouped_kind(kind)) {
            continue;
        }
        emit(kind, to_upper(kind), "\n\n", false);
    }
    return oss.str();
}

}  // namespace factforge
