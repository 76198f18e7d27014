// ==============================================================================
// coercion.cpp - Приведение значений к типам полей
// ==============================================================================

#include <factforge/coercion.hpp>
#include <factforge/error.hpp>
#include <factforge/fact.hpp>
#include <factforge/schema_text.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace factforge {

namespace {

constexpr double kInt64Lower = -9223372036854775808.0;  // -2^63
constexpr double kInt64Upper = 9223372036854775808.0;   // 2^63

std::string target_name(const FieldSpec& field) {
    if (field.type == FieldType::Object) {
        return "object " + field.object_type;
    }
    return to_string(field.type);
}

[[noreturn]] void fail(const Value& raw, const FieldSpec& field, const std::string& reason = {}) {
    throw CoercionError(field.name, target_name(field), raw.to_text(), reason);
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// ----------------------------------------------------------------------------
// Целые
// ----------------------------------------------------------------------------

Value coerce_integral(const Value& raw, const FieldSpec& field) {
    const bool narrow = field.type == FieldType::Integer;
    const std::int64_t lo =
        narrow ? std::numeric_limits<std::int32_t>::min() : std::numeric_limits<std::int64_t>::min();
    const std::int64_t hi =
        narrow ? std::numeric_limits<std::int32_t>::max() : std::numeric_limits<std::int64_t>::max();

    std::int64_t result = 0;
    if (const auto* i = raw.get_int()) {
        result = *i;
    } else if (const auto* u = raw.get_uint()) {
        if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            fail(raw, field, "out of range");
        }
        result = static_cast<std::int64_t>(*u);
    } else if (const auto* d = raw.get_double()) {
        if (!std::isfinite(*d)) {
            fail(raw, field, "not a finite number");
        }
        double t = std::trunc(*d);
        if (t < kInt64Lower || t >= kInt64Upper) {
            fail(raw, field, "out of range");
        }
        result = static_cast<std::int64_t>(t);
    } else if (const auto* s = raw.get_string()) {
        auto parsed = parse_integer(*s);
        if (!parsed) {
            fail(raw, field, "not a number");
        }
        result = *parsed;
    } else {
        fail(raw, field);
    }

    if (result < lo || result > hi) {
        fail(raw, field, "out of range");
    }
    return Value(result);
}

// ----------------------------------------------------------------------------
// Списки
// ----------------------------------------------------------------------------

Value coerce_list(const Value& raw, const FieldSpec& field, NestedMaterializer* nested) {
    ValueArray items;
    if (const auto* arr = raw.get_array()) {
        items = *arr;
    } else if (raw.is_scalar()) {
        items.push_back(raw);
    } else {
        fail(raw, field);
    }

    if (field.element_type.empty()) {
        return Value(std::move(items));
    }

    // Подсказка типа элемента: скаляр или имя схемы
    TypeRef hint = parse_type_name(field.element_type);
    FieldSpec element(field.name, hint.type);
    element.object_type = hint.object_type;
    element.element_type = hint.element_type;

    for (std::size_t i = 0; i < items.size(); ++i) {
        element.name = field.name + "[" + std::to_string(i) + "]";
        items[i] = coerce(items[i], element, nested);
    }
    return Value(std::move(items));
}

// ----------------------------------------------------------------------------
// Ссылки на схемы
// ----------------------------------------------------------------------------

Value coerce_reference(const Value& raw, const FieldSpec& field, NestedMaterializer* nested) {
    if (const Fact* fact = raw.get_fact()) {
        if (fact->schema_name() != field.object_type) {
            fail(raw, field, "fact of schema '" + fact->schema_name() + "'");
        }
        return raw;
    }
    if (raw.is_object()) {
        if (nested == nullptr) {
            fail(raw, field, "nested materialization is not available here");
        }
        return Value(nested->materialize_nested(field.object_type, raw));
    }
    fail(raw, field);
}

}  // namespace

// ----------------------------------------------------------------------------
// Разбор чисел
// ----------------------------------------------------------------------------

std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<double> parse_double(std::string_view text) {
    std::string_view t = trim(text);
    if (!t.empty() && t.front() == '+') {
        t.remove_prefix(1);
    }
    if (t.empty()) {
        return std::nullopt;
    }
    double out = 0.0;
    auto res = std::from_chars(t.data(), t.data() + t.size(), out);
    if (res.ec != std::errc() || res.ptr != t.data() + t.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
    std::string_view t = trim(text);
    if (!t.empty() && t.front() == '+') {
        t.remove_prefix(1);
    }
    if (t.empty()) {
        return std::nullopt;
    }

    std::int64_t out = 0;
    auto res = std::from_chars(t.data(), t.data() + t.size(), out);
    if (res.ec == std::errc() && res.ptr == t.data() + t.size()) {
        return out;
    }
    if (res.ec == std::errc::result_out_of_range) {
        return std::nullopt;
    }

    // "3.9" -> 3
    auto d = parse_double(t);
    if (!d || !std::isfinite(*d)) {
        return std::nullopt;
    }
    double truncated = std::trunc(*d);
    if (truncated < kInt64Lower || truncated >= kInt64Upper) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(truncated);
}

// ----------------------------------------------------------------------------
// coerce
// ----------------------------------------------------------------------------

Value coerce(const Value& raw, const FieldSpec& field, NestedMaterializer* nested) {
    if (raw.is_null()) {
        if (!field.has_default()) {
            return Value();
        }
        FieldSpec plain = field;
        plain.default_value = Value();
        return coerce(field.default_value, plain, nested);
    }

    switch (field.type) {
    case FieldType::String:
        if (!raw.is_scalar()) {
            fail(raw, field);
        }
        if (raw.is_string()) {
            return raw;
        }
        return Value(raw.to_text());

    case FieldType::Integer:
    case FieldType::Long:
        return coerce_integral(raw, field);

    case FieldType::Double:
        if (const auto* d = raw.get_double()) {
            return Value(*d);
        }
        if (const auto* i = raw.get_int()) {
            return Value(static_cast<double>(*i));
        }
        if (const auto* u = raw.get_uint()) {
            return Value(static_cast<double>(*u));
        }
        if (const auto* s = raw.get_string()) {
            if (auto parsed = parse_double(*s)) {
                return Value(*parsed);
            }
            fail(raw, field, "not a number");
        }
        fail(raw, field);

    case FieldType::Boolean:
        if (raw.is_bool()) {
            return raw;
        }
        if (const auto* s = raw.get_string()) {
            std::string_view t = trim(*s);
            if (equals_ignore_case(t, "true")) {
                return Value(true);
            }
            if (equals_ignore_case(t, "false")) {
                return Value(false);
            }
        }
        fail(raw, field);

    case FieldType::List:
        return coerce_list(raw, field, nested);

    case FieldType::Map:
        if (!raw.is_object()) {
            fail(raw, field);
        }
        return raw;

    case FieldType::Object:
        return coerce_reference(raw, field, nested);
    }

    fail(raw, field);
}

}  // namespace factforge
