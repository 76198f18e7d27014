// ==============================================================================
// class_materializer.cpp - Кэш типов и материализация скомпилированных фактов
// ==============================================================================

#include <factforge/coercion.hpp>
#include <factforge/error.hpp>
#include <factforge/materializer.hpp>

#include <mutex>

namespace factforge {

// ----------------------------------------------------------------------------
// TypeCache
// ----------------------------------------------------------------------------

std::shared_ptr<const CompiledType> TypeCache::find(const std::string& name,
                                                    std::uint64_t revision) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second.revision != revision) {
        return nullptr;
    }
    return it->second.type;
}

void TypeCache::store(const std::string& name, std::uint64_t revision,
                      std::shared_ptr<const CompiledType> type) {
    std::unique_lock lock(mutex_);
    auto& entry = entries_[name];
    if (entry.type && entry.revision > revision) {
        return;
    }
    entry.revision = revision;
    entry.type = std::move(type);
}

bool TypeCache::invalidate(const std::string& name) {
    std::unique_lock lock(mutex_);
    return entries_.erase(name) > 0;
}

void TypeCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

std::size_t TypeCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

bool TypeCache::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return entries_.find(name) != entries_.end();
}

// ----------------------------------------------------------------------------
// ClassMaterializer
// ----------------------------------------------------------------------------

ClassMaterializer::ClassMaterializer(std::shared_ptr<const TypeCompiler> compiler,
                                     output::Writer* writer)
    : compiler_(compiler ? std::move(compiler) : std::make_shared<LayoutCompiler>()),
      writer_(writer != nullptr ? writer : &output::quiet_writer()) {}

std::shared_ptr<const CompiledType> ClassMaterializer::compiled_type(const ObjectSchema& schema) {
    if (!compiler_->available()) {
        throw MaterializationError(MaterializationError::Kind::CompilerUnavailable,
                                   "type compiler '" + compiler_->name() + "' is not available");
    }

    std::string source = generate_source(schema);
    auto cached = cache_.find(schema.name(), schema.revision());
    if (cached && cached->source() == source) {
        return cached;
    }

    // Компиляция вне блокировки кэша
    writer_->debug("compiling type " + schema.name() + " (revision " +
                   std::to_string(schema.revision()) + ") with " + compiler_->name());
    ++compile_count_;
    CompileResult result = compiler_->compile(source);

    if (!result) {
        std::string message = "compilation of type '" + schema.name() + "' failed";
        for (const auto& d : result.diagnostics) {
            if (d.field) {
                message += " (field '" + *d.field + "')";
                break;
            }
        }
        throw MaterializationError(MaterializationError::Kind::CompileFailed, message,
                                   std::move(source), std::move(result.diagnostics));
    }
    if (!result.type || result.type->name() != schema.name()) {
        throw MaterializationError(MaterializationError::Kind::CompileFailed,
                                   "compiler produced no type named '" + schema.name() + "'",
                                   std::move(source));
    }

    writer_->trace("type " + schema.name() + " compiled: " +
                   std::to_string(result.type->slot_count()) + " slots");
    cache_.store(schema.name(), schema.revision(), result.type);
    return result.type;
}

FactPtr ClassMaterializer::materialize(const std::shared_ptr<const ObjectSchema>& schema,
                                       const ValueObject& values) {
    auto type = compiled_type(*schema);
    auto fact = std::make_shared<CompiledFact>(schema, type);

    // Отсутствующий ключ получает значение по умолчанию поля, в том числе
    // для списков и map, которых нет в разметке типа
    for (const auto& field : schema->fields()) {
        auto it = values.find(field.name);
        Value value = it == values.end() ? coerce(Value(), field) : it->second;
        if (!value.is_null()) {
            fact->write(field.setter_name(), std::move(value));
        }
    }
    return fact;
}

void ClassMaterializer::invalidate(const std::string& schema_name) {
    if (cache_.invalidate(schema_name)) {
        writer_->debug("compiled type " + schema_name + " invalidated");
    }
}

}  // namespace factforge
