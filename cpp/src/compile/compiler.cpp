// ==============================================================================
// compiler.cpp - Встроенный компилятор исходного текста типов
// ==============================================================================
//
// Компиляция в два прохода:
// - лексер: слова, пунктуация { } ( ) ; : , = < > ->, строки в кавычках
// - парсер: члены класса + перекрёстные проверки (аксессоры, конструктор)
//
// Синтаксическая ошибка фиксируется и разбор продолжается со следующего ';'.
//
// ==============================================================================

#include <factforge/compiler.hpp>
#include <factforge/schema.hpp>
#include <factforge/schema_text.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <unordered_set>

namespace factforge {

namespace {

// ----------------------------------------------------------------------------
// Лексер
// ----------------------------------------------------------------------------

struct Token {
    enum class Type { Word, Punct, String, End };

    Type type = Type::End;
    std::string text;
    std::size_t line = 1;
    std::size_t column = 1;

    bool is_punct(std::string_view p) const { return type == Type::Punct && text == p; }
    bool is_word(std::string_view w) const { return type == Type::Word && text == w; }
};

bool is_punct_char(char c) {
    switch (c) {
    case '{':
    case '}':
    case '(':
    case ')':
    case ';':
    case ':':
    case ',':
    case '=':
    case '<':
    case '>':
        return true;
    default:
        return false;
    }
}

struct LexError {
    std::size_t line;
    std::size_t column;
    std::string message;
};

std::vector<Token> lex(std::string_view src, std::vector<LexError>& errors) {
    std::vector<Token> tokens;
    std::size_t pos = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    auto advance = [&](std::size_t n) {
        for (std::size_t k = 0; k < n && pos < src.size(); ++k, ++pos) {
            if (src[pos] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
    };

    while (pos < src.size()) {
        char c = src[pos];
        if (std::isspace(static_cast<unsigned char>(c))) {
            advance(1);
            continue;
        }

        Token tok;
        tok.line = line;
        tok.column = column;

        if (c == '-' && pos + 1 < src.size() && src[pos + 1] == '>') {
            tok.type = Token::Type::Punct;
            tok.text = "->";
            advance(2);
        } else if (is_punct_char(c)) {
            tok.type = Token::Type::Punct;
            tok.text = std::string(1, c);
            advance(1);
        } else if (c == '"') {
            advance(1);
            std::string text;
            bool closed = false;
            while (pos < src.size()) {
                char s = src[pos];
                if (s == '"') {
                    closed = true;
                    advance(1);
                    break;
                }
                if (s == '\\' && pos + 1 < src.size()) {
                    char e = src[pos + 1];
                    text += e == 'n' ? '\n' : e == 't' ? '\t' : e == 'r' ? '\r' : e;
                    advance(2);
                    continue;
                }
                text += s;
                advance(1);
            }
            if (!closed) {
                errors.push_back({tok.line, tok.column, "unterminated string literal"});
            }
            tok.type = Token::Type::String;
            tok.text = std::move(text);
        } else {
            while (pos < src.size()) {
                char w = src[pos];
                if (std::isspace(static_cast<unsigned char>(w)) || is_punct_char(w) || w == '"') {
                    break;
                }
                if (w == '-' && pos + 1 < src.size() && src[pos + 1] == '>') {
                    break;
                }
                tok.text += w;
                advance(1);
            }
            tok.type = Token::Type::Word;
        }
        tokens.push_back(std::move(tok));
    }

    Token end;
    end.type = Token::Type::End;
    end.line = line;
    end.column = column;
    tokens.push_back(std::move(end));
    return tokens;
}

// ----------------------------------------------------------------------------
// Парсер
// ----------------------------------------------------------------------------

constexpr std::array<const char*, 10> kReserved = {"class", "field",  "constructor", "getter",
                                                   "setter", "method", "ref",         "true",
                                                   "false",  "null"};

constexpr std::array<const char*, 3> kObjectMethods = {"toString", "equals", "hashCode"};

bool is_reserved(std::string_view word) {
    return std::any_of(kReserved.begin(), kReserved.end(),
                       [&](const char* r) { return word == r; });
}

bool is_type_name(std::string_view word) {
    if (word.empty()) {
        return false;
    }
    std::size_t start = 0;
    while (start <= word.size()) {
        auto dot = word.find('.', start);
        auto part = word.substr(start, dot == std::string_view::npos ? dot : dot - start);
        if (!is_identifier(part)) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        start = dot + 1;
    }
    return false;
}

struct SyntaxError {
    std::size_t line;
    std::size_t column;
    std::string message;
};

struct AccessorDecl {
    Accessor::Kind kind;
    Token name;
    Token target;
};

class LayoutParser {
public:
    LayoutParser(std::vector<Token> tokens, std::vector<Diagnostic>& diagnostics)
        : tokens_(std::move(tokens)), diagnostics_(diagnostics) {}

    std::shared_ptr<const CompiledType> parse(std::string source) {
        try {
            parse_header();
        } catch (const SyntaxError& e) {
            report(e.line, e.column, e.message);
            return nullptr;
        }

        while (!peek().is_punct("}") && peek().type != Token::Type::End) {
            try {
                parse_member();
            } catch (const SyntaxError& e) {
                report(e.line, e.column, e.message);
                recover();
            }
        }

        if (peek().type == Token::Type::End) {
            report(peek().line, peek().column, "expected '}' at end of class " + class_name_);
        } else {
            next();
            if (peek().type != Token::Type::End) {
                report(peek().line, peek().column,
                       "unexpected '" + peek().text + "' after end of class");
            }
        }

        check_accessors();
        check_constructor();

        if (!diagnostics_.empty()) {
            return nullptr;
        }

        std::unordered_map<std::string, Accessor> accessors;
        for (const auto& decl : accessor_decls_) {
            Accessor acc;
            acc.kind = decl.kind;
            acc.slot = static_cast<std::size_t>(slot_of(decl.target.text));
            accessors.emplace(decl.name.text, acc);
        }
        return std::make_shared<const CompiledType>(class_name_, std::move(source),
                                                    std::move(slots_), std::move(accessors),
                                                    std::move(methods_));
    }

private:
    // ------------------------------------------------------------------------
    // Токены
    // ------------------------------------------------------------------------

    const Token& peek() const { return tokens_[pos_]; }

    const Token& next() {
        const Token& tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return tok;
    }

    [[noreturn]] void fail(const Token& tok, const std::string& message) const {
        std::string got = tok.type == Token::Type::End ? "end of input" : "'" + tok.text + "'";
        throw SyntaxError{tok.line, tok.column, message + ", got " + got};
    }

    void expect_punct(std::string_view p) {
        if (!peek().is_punct(p)) {
            fail(peek(), "expected '" + std::string(p) + "'");
        }
        next();
    }

    const Token& expect_word(const std::string& what) {
        if (peek().type != Token::Type::Word) {
            fail(peek(), "expected " + what);
        }
        return next();
    }

    /// Пропуск до ';' включительно или до '}'
    void recover() {
        while (peek().type != Token::Type::End && !peek().is_punct("}")) {
            if (next().is_punct(";")) {
                return;
            }
        }
    }

    void report(std::size_t line, std::size_t column, std::string message,
                std::optional<std::string> field = std::nullopt) {
        diagnostics_.push_back(Diagnostic{line, column, std::move(message), std::move(field)});
    }

    void report(const Token& tok, std::string message,
                std::optional<std::string> field = std::nullopt) {
        report(tok.line, tok.column, std::move(message), std::move(field));
    }

    int slot_of(std::string_view name) const {
        for (std::size_t i = 0; i < slots_.size(); ++i) {
            if (slots_[i].name == name) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    // ------------------------------------------------------------------------
    // Грамматика
    // ------------------------------------------------------------------------

    void parse_header() {
        const Token& kw = expect_word("'class'");
        if (kw.text != "class") {
            fail(kw, "expected 'class'");
        }
        const Token& name = expect_word("class name");
        class_name_ = name.text;
        if (!is_type_name(class_name_) || is_reserved(class_name_)) {
            report(name, "invalid class name '" + class_name_ + "'");
        }
        expect_punct("{");
    }

    void parse_member() {
        const Token& kw = expect_word("member declaration");
        if (kw.text == "field") {
            parse_field();
        } else if (kw.text == "constructor") {
            parse_constructor(kw);
        } else if (kw.text == "getter") {
            parse_accessor(Accessor::Kind::Getter);
        } else if (kw.text == "setter") {
            parse_accessor(Accessor::Kind::Setter);
        } else if (kw.text == "method") {
            parse_method();
        } else {
            fail(kw, "expected field, constructor, getter, setter or method");
        }
    }

    void parse_field() {
        const Token& index_tok = expect_word("slot index");
        std::size_t index = 0;
        auto res = std::from_chars(index_tok.text.data(),
                                   index_tok.text.data() + index_tok.text.size(), index);
        if (res.ec != std::errc() || res.ptr != index_tok.text.data() + index_tok.text.size()) {
            fail(index_tok, "expected slot index");
        }

        const Token& name_tok = expect_word("field name");
        const std::string& name = name_tok.text;

        if (index != slots_.size()) {
            report(index_tok,
                   "slot index " + index_tok.text + " out of order, expected " +
                       std::to_string(slots_.size()),
                   name);
        }
        // Позиция имени в грамматике фиксирована, ключевые слова допустимы
        if (!is_identifier(name)) {
            report(name_tok, "invalid field name '" + name + "'", name);
        } else if (slot_of(name) >= 0) {
            report(name_tok, "duplicate field '" + name + "'", name);
        }

        expect_punct(":");
        Slot slot = parse_slot_type(name);
        slot.name = name;

        if (peek().is_punct("=")) {
            next();
            parse_default(slot);
        }
        expect_punct(";");
        slots_.push_back(std::move(slot));
    }

    Slot parse_slot_type(const std::string& field) {
        const Token& type_tok = expect_word("slot type");
        const std::string& t = type_tok.text;
        Slot slot;

        if (t == "string") {
            slot.type = SlotType::String;
        } else if (t == "int32") {
            slot.type = SlotType::Int32;
        } else if (t == "int64") {
            slot.type = SlotType::Int64;
        } else if (t == "double") {
            slot.type = SlotType::Double;
        } else if (t == "bool") {
            slot.type = SlotType::Bool;
        } else if (t == "map") {
            slot.type = SlotType::Map;
        } else if (t == "list") {
            slot.type = SlotType::List;
            if (peek().is_punct("<")) {
                next();
                const Token& elem = expect_word("element type");
                if (!is_type_name(elem.text)) {
                    report(elem, "invalid element type '" + elem.text + "'", field);
                }
                slot.element_type = elem.text;
                expect_punct(">");
            }
        } else if (t == "ref") {
            slot.type = SlotType::Ref;
            const Token& target = expect_word("referenced type");
            if (!is_type_name(target.text)) {
                report(target, "invalid referenced type '" + target.text + "'", field);
            }
            slot.ref_type = target.text;
        } else {
            report(type_tok, "unknown slot type '" + t + "'", field);
        }
        return slot;
    }

    void parse_default(Slot& slot) {
        const Token& lit = next();
        Value value;

        if (lit.type == Token::Type::String) {
            value = Value(lit.text);
        } else if (lit.type == Token::Type::Word) {
            try {
                value = parse_literal(lit.text);
            } catch (const std::invalid_argument&) {
                report(lit, "invalid default literal '" + lit.text + "'", slot.name);
                return;
            }
        } else {
            fail(lit, "expected default literal");
        }

        // Целые литералы допустимы для double-слотов
        if (slot.type == SlotType::Double && value.is_integer()) {
            value = Value(value.is_int() ? static_cast<double>(value.as_int())
                                         : static_cast<double>(value.as_uint()));
        }
        if (!slot.accepts(value)) {
            report(lit,
                   "default " + lit.text + " does not match slot type " + to_string(slot.type),
                   slot.name);
            return;
        }
        slot.default_value = std::move(value);
    }

    void parse_constructor(const Token& kw) {
        if (constructor_seen_) {
            report(kw, "duplicate constructor");
        }
        constructor_seen_ = true;
        constructor_token_ = kw;
        constructor_params_.clear();

        expect_punct("(");
        if (!peek().is_punct(")")) {
            constructor_params_.push_back(expect_word("parameter name"));
            while (peek().is_punct(",")) {
                next();
                constructor_params_.push_back(expect_word("parameter name"));
            }
        }
        expect_punct(")");
        expect_punct(";");
    }

    void parse_accessor(Accessor::Kind kind) {
        AccessorDecl decl{kind, expect_word("accessor name"), Token{}};
        expect_punct("->");
        decl.target = expect_word("field name");
        expect_punct(";");
        accessor_decls_.push_back(std::move(decl));
    }

    void parse_method() {
        const Token& name = expect_word("method name");
        expect_punct(";");
        bool known = std::any_of(kObjectMethods.begin(), kObjectMethods.end(),
                                 [&](const char* m) { return name.text == m; });
        if (!known) {
            report(name, "unknown method '" + name.text + "'");
            return;
        }
        if (std::find(methods_.begin(), methods_.end(), name.text) != methods_.end()) {
            report(name, "duplicate method '" + name.text + "'");
            return;
        }
        methods_.push_back(name.text);
    }

    // ------------------------------------------------------------------------
    // Перекрёстные проверки
    // ------------------------------------------------------------------------

    void check_accessors() {
        std::unordered_set<std::string> seen;
        std::vector<bool> has_getter(slots_.size(), false);
        std::vector<bool> has_setter(slots_.size(), false);

        for (const auto& decl : accessor_decls_) {
            const std::string& target = decl.target.text;
            if (!seen.insert(decl.name.text).second) {
                report(decl.name, "duplicate accessor '" + decl.name.text + "'", target);
                continue;
            }
            int slot = slot_of(target);
            if (slot < 0) {
                report(decl.target, "accessor '" + decl.name.text + "' targets unknown field '" +
                                        target + "'",
                       target);
                continue;
            }

            std::string expected;
            if (decl.kind == Accessor::Kind::Getter) {
                const char* prefix = slots_[slot].type == SlotType::Bool ? "is" : "get";
                expected = prefix + capitalize(target);
                has_getter[slot] = true;
            } else {
                expected = "set" + capitalize(target);
                has_setter[slot] = true;
            }
            if (decl.name.text != expected || !is_identifier(decl.name.text)) {
                report(decl.name,
                       "invalid accessor name '" + decl.name.text + "', expected '" + expected +
                           "'",
                       target);
            }
        }

        for (std::size_t i = 0; i < slots_.size(); ++i) {
            if (!has_getter[i]) {
                report(peek(), "field '" + slots_[i].name + "' has no getter", slots_[i].name);
            }
            if (!has_setter[i]) {
                report(peek(), "field '" + slots_[i].name + "' has no setter", slots_[i].name);
            }
        }
    }

    void check_constructor() {
        if (!constructor_seen_) {
            report(peek(), "class " + class_name_ + " declares no constructor");
            return;
        }
        if (constructor_params_.size() != slots_.size()) {
            report(constructor_token_, "constructor takes " +
                                           std::to_string(constructor_params_.size()) +
                                           " parameters, class has " +
                                           std::to_string(slots_.size()) + " fields");
            return;
        }
        for (std::size_t i = 0; i < slots_.size(); ++i) {
            if (constructor_params_[i].text != slots_[i].name) {
                report(constructor_params_[i],
                       "constructor parameter '" + constructor_params_[i].text +
                           "' does not match field '" + slots_[i].name + "'",
                       slots_[i].name);
            }
        }
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::vector<Diagnostic>& diagnostics_;

    std::string class_name_;
    std::vector<Slot> slots_;
    std::vector<AccessorDecl> accessor_decls_;
    std::vector<std::string> methods_;

    bool constructor_seen_ = false;
    Token constructor_token_;
    std::vector<Token> constructor_params_;
};

}  // namespace

// ----------------------------------------------------------------------------
// LayoutCompiler
// ----------------------------------------------------------------------------

CompileResult LayoutCompiler::compile(std::string_view source) const {
    CompileResult result;

    std::vector<LexError> lex_errors;
    auto tokens = lex(source, lex_errors);
    for (auto& e : lex_errors) {
        result.diagnostics.push_back(Diagnostic{e.line, e.column, std::move(e.message), {}});
    }

    LayoutParser parser(std::move(tokens), result.diagnostics);
    auto type = parser.parse(std::string(source));

    result.ok = type != nullptr && result.diagnostics.empty();
    if (result.ok) {
        result.type = std::move(type);
    }
    return result;
}

}  // namespace factforge
