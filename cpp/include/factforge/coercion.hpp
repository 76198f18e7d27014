// ==============================================================================
// factforge/coercion.hpp - Приведение значений JSON к типам полей
// ==============================================================================
//
// Назначение:
// - coerce(raw, field): приведение "свободного" значения к объявленному типу
// - Правила для string/integer/long/double/boolean/list/map/object
// - NestedMaterializer: точка расширения для вложенных object-reference полей
//
// Приведение детерминировано и не зависит от стратегии материализации.
//
// ==============================================================================

#ifndef FACTFORGE_COERCION_HPP
#define FACTFORGE_COERCION_HPP

#include <factforge/schema.hpp>
#include <factforge/value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace factforge {

// ----------------------------------------------------------------------------
// NestedMaterializer
// ----------------------------------------------------------------------------

/// Материализация map-значения в факт указанной схемы (реализует фасад)
class NestedMaterializer {
public:
    virtual ~NestedMaterializer() = default;

    /// @throw SchemaNotFoundError, ValidationError, CoercionError, MaterializationError
    virtual FactPtr materialize_nested(const std::string& schema_name, const Value& fields) = 0;
};

// ----------------------------------------------------------------------------
// Coercion
// ----------------------------------------------------------------------------

/// Привести raw к типу поля.
/// null заменяется значением по умолчанию поля (или остаётся null).
/// Object-значения object-reference полей материализуются через nested;
/// без nested принимаются только факты нужной схемы.
/// @throw CoercionError если приведение невозможно
Value coerce(const Value& raw, const FieldSpec& field, NestedMaterializer* nested = nullptr);

/// Разбор целого из строки ("42", " -7 ", "3.9" -> 3); nullopt если не число
std::optional<std::int64_t> parse_integer(std::string_view text);

/// Разбор вещественного из строки; nullopt если не число
std::optional<double> parse_double(std::string_view text);

/// Удаление пробельных символов по краям
std::string_view trim(std::string_view s);

}  // namespace factforge

#endif  // FACTFORGE_COERCION_HPP
