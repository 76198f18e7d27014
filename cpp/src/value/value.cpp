// ==============================================================================
// value.cpp - Реализация Value (каноническая модель значения)
// ==============================================================================

#include <factforge/fact.hpp>
#include <factforge/value.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <functional>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

namespace factforge {

// ----------------------------------------------------------------------------
// Копирование
// ----------------------------------------------------------------------------

Value::Data Value::deep_copy(const Data& data) {
    if (const auto* arr = std::get_if<std::shared_ptr<Array>>(&data)) {
        return std::make_shared<Array>(**arr);
    }
    if (const auto* obj = std::get_if<std::shared_ptr<Object>>(&data)) {
        return std::make_shared<Object>(**obj);
    }
    return data;
}

// ----------------------------------------------------------------------------
// format_double
// ----------------------------------------------------------------------------

std::string format_double(double d) {
    if (std::isnan(d)) {
        return "NaN";
    }
    if (std::isinf(d)) {
        return d > 0 ? "Infinity" : "-Infinity";
    }

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    std::string out(buf, res.ptr);

    // Целые значения печатаем как 25.0, чтобы отличать от integer
    if (out.find_first_of(".e") == std::string::npos) {
        out += ".0";
    }
    return out;
}

// ----------------------------------------------------------------------------
// Равенство
// ----------------------------------------------------------------------------

bool Value::operator==(const Value& other) const {
    // int/uint сравниваются математически
    if (is_integer() && other.is_integer()) {
        if (is_int() && other.is_int()) {
            return as_int() == other.as_int();
        }
        if (is_uint() && other.is_uint()) {
            return as_uint() == other.as_uint();
        }
        const Value& i = is_int() ? *this : other;
        const Value& u = is_int() ? other : *this;
        return i.as_int() >= 0 && static_cast<std::uint64_t>(i.as_int()) == u.as_uint();
    }

    if (kind() != other.kind()) {
        return false;
    }

    switch (kind()) {
    case Kind::Null:
        return true;
    case Kind::Bool:
        return as_bool() == other.as_bool();
    case Kind::Double:
        return as_double() == other.as_double();
    case Kind::String:
        return as_string() == other.as_string();
    case Kind::Array:
        return as_array() == other.as_array();
    case Kind::Object: {
        const auto& a = as_object();
        const auto& b = other.as_object();
        if (a.size() != b.size()) {
            return false;
        }
        for (const auto& [key, val] : a) {
            auto it = b.find(key);
            if (it == b.end() || !(it->second == val)) {
                return false;
            }
        }
        return true;
    }
    case Kind::Fact: {
        const Fact* a = get_fact();
        const Fact* b = other.get_fact();
        return a == b || a->equals(*b);
    }
    case Kind::Int:
    case Kind::UInt:
        break;
    }
    return false;
}

// ----------------------------------------------------------------------------
// Хеш
// ----------------------------------------------------------------------------

std::size_t Value::hash() const {
    switch (kind()) {
    case Kind::Null:
        return 0x6e756c6cULL;
    case Kind::Bool:
        return std::hash<bool>{}(as_bool()) + 0x1f;
    case Kind::Int:
        // Неотрицательные int хешируются как uint (согласованно с operator==)
        if (as_int() >= 0) {
            return std::hash<std::uint64_t>{}(static_cast<std::uint64_t>(as_int()));
        }
        return std::hash<std::int64_t>{}(as_int());
    case Kind::UInt:
        return std::hash<std::uint64_t>{}(as_uint());
    case Kind::Double:
        return std::hash<double>{}(as_double());
    case Kind::String:
        return std::hash<std::string>{}(as_string());
    case Kind::Array: {
        std::size_t seed = as_array().size();
        for (const auto& elem : as_array()) {
            hash_combine(seed, elem.hash());
        }
        return seed;
    }
    case Kind::Object: {
        // Порядок ключей в unordered_map не определён: сумма хешей пар
        std::size_t sum = 0;
        for (const auto& [key, val] : as_object()) {
            std::size_t pair_hash = std::hash<std::string>{}(key);
            hash_combine(pair_hash, val.hash());
            sum += pair_hash;
        }
        return sum;
    }
    case Kind::Fact:
        return get_fact()->hash();
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Текстовая форма
// ----------------------------------------------------------------------------

std::string Value::to_text() const {
    switch (kind()) {
    case Kind::Null:
        return "null";
    case Kind::Bool:
        return as_bool() ? "true" : "false";
    case Kind::Int:
        return std::to_string(as_int());
    case Kind::UInt:
        return std::to_string(as_uint());
    case Kind::Double:
        return format_double(as_double());
    case Kind::String:
        return as_string();
    case Kind::Array: {
        std::string out = "[";
        bool first = true;
        for (const auto& elem : as_array()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += elem.to_text();
        }
        out += "]";
        return out;
    }
    case Kind::Object: {
        // Ключи сортируются для детерминированного вывода
        std::vector<const std::string*> keys;
        keys.reserve(as_object().size());
        for (const auto& [key, val] : as_object()) {
            keys.push_back(&key);
        }
        std::sort(keys.begin(), keys.end(),
                  [](const std::string* a, const std::string* b) { return *a < *b; });

        std::string out = "{";
        bool first = true;
        for (const auto* key : keys) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += *key;
            out += "=";
            out += as_object().at(*key).to_text();
        }
        out += "}";
        return out;
    }
    case Kind::Fact:
        return get_fact()->to_string();
    }
    return "null";
}

const char* Value::type_name() const {
    switch (kind()) {
    case Kind::Null:
        return "null";
    case Kind::Bool:
        return "boolean";
    case Kind::Int:
    case Kind::UInt:
        return "integer";
    case Kind::Double:
        return "double";
    case Kind::String:
        return "string";
    case Kind::Array:
        return "list";
    case Kind::Object:
        return "map";
    case Kind::Fact:
        return "fact";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson - конверсия из RapidJSON
// ----------------------------------------------------------------------------
//
// Порядок приоритета для чисел: UInt → Int → Float
//

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        if (json.IsUint64()) {
            return Value(json.GetUint64());
        }
        if (json.IsInt64()) {
            return Value(json.GetInt64());
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i]));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            obj[key] = from_rapidjson(it->value);
        }
        return Value(std::move(obj));
    }

    // Неизвестный тип (не должно произойти)
    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson - конверсия в RapidJSON
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    switch (kind()) {
    case Kind::Null:
        out.SetNull();
        return;
    case Kind::Bool:
        out.SetBool(as_bool());
        return;
    case Kind::Int:
        out.SetInt64(as_int());
        return;
    case Kind::UInt:
        out.SetUint64(as_uint());
        return;
    case Kind::Double: {
        double d = as_double();
        // JSON не допускает NaN/Infinity
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }
    case Kind::String: {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }
    case Kind::Array: {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }
    case Kind::Object: {
        out.SetObject();
        for (const auto& [key, val] : as_object()) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
        return;
    }
    case Kind::Fact: {
        // Факт выводится как объект полей в порядке схемы
        out.SetObject();
        for (const auto& [name, val] : get_fact()->fields()) {
            rapidjson::Value k;
            k.SetString(name.c_str(), static_cast<rapidjson::SizeType>(name.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
        return;
    }
    }

    out.SetNull();
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

}  // namespace factforge
