// ==============================================================================
// factforge/schema_text.hpp - Декларативный текст схем (declare ... end)
// ==============================================================================
//
// Назначение:
// - Разбор имени типа поля (String, int, java.util.List<Address>, Address)
// - Разбор блока declare (многострочная и однострочная форма)
// - Обратный рендеринг схемы в declare-текст
// - Разбиение документа определений на блоки package/import/global/
//   declare/function/rule/query
//
// Ошибки разбора - std::invalid_argument с номером строки.
//
// ==============================================================================

#ifndef FACTFORGE_SCHEMA_TEXT_HPP
#define FACTFORGE_SCHEMA_TEXT_HPP

#include <factforge/schema.hpp>
#include <factforge/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace factforge {

// ----------------------------------------------------------------------------
// Имена типов
// ----------------------------------------------------------------------------

struct TypeRef {
    FieldType type = FieldType::String;
    std::string object_type;   // для Object
    std::string element_type;  // для List<Elem>
};

/// "int" -> Integer, "List<Address>" -> List(Address), "Address" -> Object(Address)
/// @throw std::invalid_argument для пустого или некорректного имени
TypeRef parse_type_name(std::string_view name);

/// Имя типа поля в declare-тексте
std::string render_type(const FieldSpec& field);

// ----------------------------------------------------------------------------
// Литералы значений по умолчанию
// ----------------------------------------------------------------------------

/// "text" (с escape), 42, -1.5, true, false, null
/// @throw std::invalid_argument
Value parse_literal(std::string_view text);

/// Обратное преобразование: строки в кавычках, double через format_double
std::string render_literal(const Value& value);

// ----------------------------------------------------------------------------
// declare
// ----------------------------------------------------------------------------

/// Разбор одного блока declare.
/// Поле: name : Type [= literal] [@required|@key|@other(...)].
/// Аннотации уровня типа (после имени) пропускаются.
/// @throw std::invalid_argument
ObjectSchema parse_declare(std::string_view text);

/// Многострочный declare-блок, пригодный для parse_declare
std::string render_declare(const ObjectSchema& schema);

// ----------------------------------------------------------------------------
// Документ определений
// ----------------------------------------------------------------------------

struct DefinitionBlock {
    std::string kind;     // import, global, declare, function, rule, query
    std::string name;     // ключ в реестре
    std::string content;  // исходный текст блока (trimmed)
    std::size_t line = 0;
};

struct DefinitionDocument {
    std::string package;  // пусто если нет package
    std::vector<DefinitionBlock> blocks;
};

/// Разбиение документа на блоки; комментарии // и /* */ между блоками пропускаются
/// @throw std::invalid_argument для нераспознанного текста или незакрытого блока
DefinitionDocument split_definitions(std::string_view document);

}  // namespace factforge

#endif  // FACTFORGE_SCHEMA_TEXT_HPP
