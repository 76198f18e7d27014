// ==============================================================================
// schema_text.cpp - Разбор и рендеринг declare-текста
// ==============================================================================

#include <factforge/coercion.hpp>
#include <factforge/error.hpp>
#include <factforge/schema_text.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace factforge {

namespace {

bool is_word_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '$' || c == '.';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::size_t line_at(std::string_view text, std::size_t pos) {
    std::size_t line = 1;
    for (std::size_t i = 0; i < pos && i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++line;
        }
    }
    return line;
}

[[noreturn]] void parse_error(std::size_t line, const std::string& message) {
    throw std::invalid_argument("line " + std::to_string(line) + ": " + message);
}

/// Пропуск комментария, начинающегося в pos; true если комментарий был
bool skip_comment(std::string_view text, std::size_t& pos) {
    if (pos + 1 >= text.size() || text[pos] != '/') {
        return false;
    }
    if (text[pos + 1] == '/') {
        auto eol = text.find('\n', pos);
        pos = eol == std::string_view::npos ? text.size() : eol;
        return true;
    }
    if (text[pos + 1] == '*') {
        auto close = text.find("*/", pos + 2);
        pos = close == std::string_view::npos ? text.size() : close + 2;
        return true;
    }
    return false;
}

/// Пропуск строкового литерала в кавычках quote; pos указывает на открывающую
void skip_quoted(std::string_view text, std::size_t& pos) {
    char quote = text[pos++];
    while (pos < text.size() && text[pos] != quote) {
        if (text[pos] == '\\') {
            ++pos;
        }
        ++pos;
    }
    if (pos < text.size()) {
        ++pos;
    }
}

std::string unescape(std::string_view body) {
    std::string out;
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i) {
        if (body[i] != '\\' || i + 1 >= body.size()) {
            out += body[i];
            continue;
        }
        char next = body[++i];
        switch (next) {
        case 'n':
            out += '\n';
            break;
        case 't':
            out += '\t';
            break;
        case 'r':
            out += '\r';
            break;
        default:
            out += next;
            break;
        }
    }
    return out;
}

std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

// ----------------------------------------------------------------------------
// Лексер declare-блока
// ----------------------------------------------------------------------------

struct Token {
    enum class Type { Word, Colon, Equals, String, Annotation };

    Type type = Type::Word;
    std::string text;
    std::size_t line = 1;
};

std::vector<Token> tokenize_declare(std::string_view text) {
    std::vector<Token> tokens;
    std::size_t pos = 0;

    while (pos < text.size()) {
        char c = text[pos];
        if (is_space(c)) {
            ++pos;
            continue;
        }
        if (skip_comment(text, pos)) {
            continue;
        }

        Token tok;
        tok.line = line_at(text, pos);

        if (c == ':') {
            tok.type = Token::Type::Colon;
            tok.text = ":";
            ++pos;
        } else if (c == '=') {
            tok.type = Token::Type::Equals;
            tok.text = "=";
            ++pos;
        } else if (c == '"') {
            std::size_t start = pos;
            skip_quoted(text, pos);
            if (pos - start < 2 || text[pos - 1] != '"') {
                parse_error(tok.line, "unterminated string literal");
            }
            tok.type = Token::Type::String;
            tok.text = unescape(text.substr(start + 1, pos - start - 2));
        } else if (c == '@') {
            ++pos;
            std::size_t start = pos;
            while (pos < text.size() && is_word_char(text[pos])) {
                ++pos;
            }
            tok.type = Token::Type::Annotation;
            tok.text = std::string(text.substr(start, pos - start));
            // Аргументы аннотации @role(event) не используются
            std::size_t look = pos;
            while (look < text.size() && (text[look] == ' ' || text[look] == '\t')) {
                ++look;
            }
            if (look < text.size() && text[look] == '(') {
                auto close = text.find(')', look);
                if (close == std::string_view::npos) {
                    parse_error(tok.line, "unterminated annotation '@" + tok.text + "'");
                }
                pos = close + 1;
            }
        } else {
            // Слово; внутри <...> пробелы и запятые входят в слово
            int depth = 0;
            while (pos < text.size()) {
                char w = text[pos];
                if (w == '<') {
                    ++depth;
                } else if (w == '>') {
                    --depth;
                } else if (depth == 0 &&
                           (is_space(w) || w == ':' || w == '=' || w == '"' || w == '@')) {
                    break;
                }
                if (!is_space(w)) {
                    tok.text += w;
                }
                ++pos;
            }
            tok.type = Token::Type::Word;
        }

        tokens.push_back(std::move(tok));
    }
    return tokens;
}

// ----------------------------------------------------------------------------
// Таблица имён типов
// ----------------------------------------------------------------------------

const std::unordered_map<std::string, FieldType>& builtin_type_names() {
    static const std::unordered_map<std::string, FieldType> names = {
        {"String", FieldType::String},
        {"string", FieldType::String},
        {"java.lang.String", FieldType::String},
        {"int", FieldType::Integer},
        {"Integer", FieldType::Integer},
        {"java.lang.Integer", FieldType::Integer},
        {"short", FieldType::Integer},
        {"Short", FieldType::Integer},
        {"byte", FieldType::Integer},
        {"Byte", FieldType::Integer},
        {"long", FieldType::Long},
        {"Long", FieldType::Long},
        {"java.lang.Long", FieldType::Long},
        {"double", FieldType::Double},
        {"Double", FieldType::Double},
        {"java.lang.Double", FieldType::Double},
        {"float", FieldType::Double},
        {"Float", FieldType::Double},
        {"Number", FieldType::Double},
        {"boolean", FieldType::Boolean},
        {"Boolean", FieldType::Boolean},
        {"java.lang.Boolean", FieldType::Boolean},
        {"bool", FieldType::Boolean},
        {"List", FieldType::List},
        {"java.util.List", FieldType::List},
        {"Map", FieldType::Map},
        {"java.util.Map", FieldType::Map},
    };
    return names;
}

}  // namespace

// ============================================================================
// Имена типов
// ============================================================================

TypeRef parse_type_name(std::string_view name) {
    std::string compact;
    for (char c : name) {
        if (!is_space(c)) {
            compact += c;
        }
    }
    if (compact.empty()) {
        throw std::invalid_argument("type name cannot be empty");
    }

    TypeRef ref;
    std::string base = compact;
    std::string args;
    auto lt = compact.find('<');
    if (lt != std::string::npos) {
        if (compact.back() != '>' || lt == 0) {
            throw std::invalid_argument("malformed generic type '" + compact + "'");
        }
        base = compact.substr(0, lt);
        args = compact.substr(lt + 1, compact.size() - lt - 2);
    }

    const auto& names = builtin_type_names();
    auto it = names.find(base);
    if (it != names.end()) {
        ref.type = it->second;
        if (!args.empty()) {
            if (ref.type == FieldType::List) {
                if (args.find(',') != std::string::npos) {
                    throw std::invalid_argument("list type takes one argument: '" + compact + "'");
                }
                ref.element_type = args;
            } else if (ref.type != FieldType::Map) {
                throw std::invalid_argument("type '" + base + "' is not generic");
            }
        }
        return ref;
    }

    if (!args.empty()) {
        throw std::invalid_argument("unsupported generic type '" + compact + "'");
    }
    for (char c : base) {
        if (!is_word_char(c)) {
            throw std::invalid_argument("invalid type name '" + compact + "'");
        }
    }
    ref.type = FieldType::Object;
    ref.object_type = base;
    return ref;
}

std::string render_type(const FieldSpec& field) {
    switch (field.type) {
    case FieldType::Object:
        return field.object_type;
    case FieldType::List:
        if (!field.element_type.empty()) {
            return "java.util.List<" + field.element_type + ">";
        }
        return declared_type_name(field.type);
    default:
        return declared_type_name(field.type);
    }
}

// ============================================================================
// Литералы
// ============================================================================

Value parse_literal(std::string_view text) {
    std::string_view t = trim(text);
    if (t.empty()) {
        throw std::invalid_argument("empty literal");
    }
    if (t.front() == '"') {
        if (t.size() < 2 || t.back() != '"') {
            throw std::invalid_argument("unterminated string literal");
        }
        return Value(unescape(t.substr(1, t.size() - 2)));
    }
    if (t == "true") {
        return Value(true);
    }
    if (t == "false") {
        return Value(false);
    }
    if (t == "null") {
        return Value();
    }

    std::int64_t i = 0;
    auto res = std::from_chars(t.data(), t.data() + t.size(), i);
    if (res.ec == std::errc() && res.ptr == t.data() + t.size()) {
        return Value(i);
    }
    if (auto d = parse_double(t)) {
        return Value(*d);
    }
    throw std::invalid_argument("invalid literal '" + std::string(t) + "'");
}

std::string render_literal(const Value& value) {
    if (const auto* s = value.get_string()) {
        return "\"" + escape(*s) + "\"";
    }
    return value.to_text();
}

// ============================================================================
// declare
// ============================================================================

ObjectSchema parse_declare(std::string_view text) {
    auto tokens = tokenize_declare(text);
    std::size_t i = 0;

    auto expect_word = [&](const char* what) -> const Token& {
        if (i >= tokens.size()) {
            parse_error(line_at(text, text.size()), std::string("expected ") + what);
        }
        const Token& tok = tokens[i];
        if (tok.type != Token::Type::Word) {
            parse_error(tok.line, std::string("expected ") + what + ", got '" + tok.text + "'");
        }
        ++i;
        return tok;
    };

    const Token& kw = expect_word("'declare'");
    if (kw.text != "declare") {
        parse_error(kw.line, "expected 'declare', got '" + kw.text + "'");
    }
    const Token& name_tok = expect_word("type name");
    if (name_tok.text == "end") {
        parse_error(name_tok.line, "expected type name");
    }
    ObjectSchema schema(name_tok.text);

    bool closed = false;
    while (i < tokens.size()) {
        const Token& tok = tokens[i];

        if (tok.type == Token::Type::Annotation) {
            ++i;  // аннотации уровня типа
            continue;
        }
        if (tok.type != Token::Type::Word) {
            parse_error(tok.line, "unexpected '" + tok.text + "'");
        }
        if (tok.text == "end") {
            ++i;
            closed = true;
            break;
        }
        if (tok.text == "extends" && schema.field_count() == 0) {
            ++i;
            expect_word("supertype name");
            continue;
        }

        // name : Type [= literal] [@annotations]
        const Token& field_tok = expect_word("field name");
        if (i >= tokens.size() || tokens[i].type != Token::Type::Colon) {
            parse_error(field_tok.line, "expected ':' after field '" + field_tok.text + "'");
        }
        ++i;
        const Token& type_tok = expect_word("field type");

        TypeRef ref;
        try {
            ref = parse_type_name(type_tok.text);
        } catch (const std::invalid_argument& e) {
            parse_error(type_tok.line, "field '" + field_tok.text + "': " + e.what());
        }

        FieldSpec spec(field_tok.text, ref.type);
        spec.object_type = ref.object_type;
        spec.element_type = ref.element_type;

        if (i < tokens.size() && tokens[i].type == Token::Type::Equals) {
            ++i;
            if (i >= tokens.size()) {
                parse_error(type_tok.line, "missing default value for '" + spec.name + "'");
            }
            const Token& lit = tokens[i++];
            if (lit.type != Token::Type::String && lit.type != Token::Type::Word) {
                parse_error(lit.line, "unexpected '" + lit.text + "'");
            }
            Value literal;
            try {
                literal = lit.type == Token::Type::String ? Value(lit.text) : parse_literal(lit.text);
                literal = coerce(literal, spec);
            } catch (const std::invalid_argument& e) {
                parse_error(lit.line, "field '" + spec.name + "': " + e.what());
            } catch (const CoercionError& e) {
                parse_error(lit.line, "default of field '" + spec.name + "': " + e.what());
            }
            spec.default_value = std::move(literal);
        }

        while (i < tokens.size() && tokens[i].type == Token::Type::Annotation) {
            const auto& ann = tokens[i].text;
            if (ann == "required" || ann == "key") {
                spec.required = true;
            }
            ++i;
        }

        try {
            schema.add_field(std::move(spec));
        } catch (const std::invalid_argument& e) {
            parse_error(field_tok.line, e.what());
        }
    }

    if (!closed) {
        parse_error(line_at(text, text.size()), "missing 'end' in declare " + schema.name());
    }
    if (i < tokens.size()) {
        parse_error(tokens[i].line, "unexpected text after 'end': '" + tokens[i].text + "'");
    }
    return schema;
}

std::string render_declare(const ObjectSchema& schema) {
    std::ostringstream oss;
    oss << "declare " << schema.name() << "\n";
    for (const auto& f : schema.fields()) {
        oss << "    " << f.name << " : " << render_type(f);
        if (f.has_default()) {
            oss << " = " << render_literal(f.default_value);
        }
        if (f.required) {
            oss << " @required";
        }
        oss << "\n";
    }
    oss << "end";
    return oss.str();
}

// ============================================================================
// Документ определений
// ============================================================================

namespace {

std::string_view word_at(std::string_view text, std::size_t pos) {
    std::size_t end = pos;
    while (end < text.size() && is_word_char(text[end])) {
        ++end;
    }
    return text.substr(pos, end - pos);
}

/// Конец оператора: ';' включительно или конец строки
std::size_t statement_end(std::string_view text, std::size_t pos) {
    while (pos < text.size() && text[pos] != ';' && text[pos] != '\n') {
        ++pos;
    }
    return pos < text.size() && text[pos] == ';' ? pos + 1 : pos;
}

/// Позиция за ключевым словом end (строки и комментарии пропускаются)
std::size_t block_end(std::string_view text, std::size_t pos) {
    while (pos < text.size()) {
        char c = text[pos];
        if (c == '"' || c == '\'') {
            skip_quoted(text, pos);
            continue;
        }
        if (skip_comment(text, pos)) {
            continue;
        }
        if (is_word_char(c)) {
            bool boundary = pos == 0 || !is_word_char(text[pos - 1]);
            std::string_view w = word_at(text, pos);
            if (boundary && w == "end") {
                return pos + w.size();
            }
            pos += w.size();
            continue;
        }
        ++pos;
    }
    return std::string_view::npos;
}

/// Позиция за закрывающей скобкой первого {...} блока
std::size_t brace_end(std::string_view text, std::size_t pos) {
    int depth = 0;
    bool opened = false;
    while (pos < text.size()) {
        char c = text[pos];
        if (c == '"' || c == '\'') {
            skip_quoted(text, pos);
            continue;
        }
        if (skip_comment(text, pos)) {
            continue;
        }
        if (c == '{') {
            ++depth;
            opened = true;
        } else if (c == '}') {
            --depth;
            if (opened && depth == 0) {
                return pos + 1;
            }
        }
        ++pos;
    }
    return std::string_view::npos;
}

std::vector<std::string> split_words(std::string_view s) {
    std::vector<std::string> out;
    std::string current;
    for (char c : s) {
        if (is_space(c) || c == ';') {
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        out.push_back(std::move(current));
    }
    return out;
}

/// Имя правила/запроса: "quoted name" или слово
std::string quoted_or_word(std::string_view content, std::size_t keyword_len) {
    std::size_t pos = keyword_len;
    while (pos < content.size() && is_space(content[pos])) {
        ++pos;
    }
    if (pos < content.size() && (content[pos] == '"' || content[pos] == '\'')) {
        std::size_t start = pos;
        skip_quoted(content, pos);
        if (pos - start >= 2) {
            return unescape(content.substr(start + 1, pos - start - 2));
        }
        return {};
    }
    return std::string(word_at(content, pos));
}

}  // namespace

DefinitionDocument split_definitions(std::string_view document) {
    DefinitionDocument doc;
    std::size_t pos = 0;

    while (pos < document.size()) {
        if (is_space(document[pos])) {
            ++pos;
            continue;
        }
        if (skip_comment(document, pos)) {
            continue;
        }

        std::size_t start = pos;
        std::size_t line = line_at(document, start);
        std::string keyword(word_at(document, pos));
        std::size_t end = std::string_view::npos;

        if (keyword == "package" || keyword == "import" || keyword == "global") {
            end = statement_end(document, pos);
        } else if (keyword == "declare" || keyword == "rule" || keyword == "query") {
            end = block_end(document, pos + keyword.size());
        } else if (keyword == "function") {
            end = brace_end(document, pos);
        } else {
            std::string head(document.substr(start, std::min<std::size_t>(20, document.size() - start)));
            auto eol = head.find('\n');
            if (eol != std::string::npos) {
                head.resize(eol);
            }
            parse_error(line, "unrecognized definition '" + head + "'");
        }

        if (end == std::string_view::npos) {
            parse_error(line, "unterminated " + keyword + " block");
        }

        std::string content(trim(document.substr(start, end - start)));
        pos = end;

        if (keyword == "package") {
            auto words = split_words(content);
            if (words.size() < 2) {
                parse_error(line, "package name expected");
            }
            doc.package = words[1];
            continue;
        }

        DefinitionBlock block;
        block.kind = keyword;
        block.line = line;

        if (keyword == "import" || keyword == "global") {
            auto words = split_words(content);
            if (words.size() < 2) {
                parse_error(line, keyword + " target expected");
            }
            block.name = words.back();
        } else if (keyword == "declare") {
            auto words = split_words(content);
            if (words.size() < 2) {
                parse_error(line, "declare name expected");
            }
            block.name = words[1];
        } else if (keyword == "function") {
            auto paren = content.find('(');
            std::size_t name_end = paren == std::string::npos ? 0 : paren;
            while (name_end > 0 && is_space(content[name_end - 1])) {
                --name_end;
            }
            std::size_t name_start = name_end;
            while (name_start > 0 && is_word_char(content[name_start - 1])) {
                --name_start;
            }
            block.name = content.substr(name_start, name_end - name_start);
            if (block.name.empty() || block.name == "function") {
                parse_error(line, "function name expected");
            }
        } else {
            block.name = quoted_or_word(content, keyword.size());
            if (block.name.empty()) {
                parse_error(line, keyword + " name expected");
            }
        }

        block.content = std::move(content);
        doc.blocks.push_back(std::move(block));
    }

    return doc;
}

}  // namespace factforge
