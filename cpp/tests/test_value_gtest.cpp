// ==============================================================================
// test_value_gtest.cpp - Тесты модели значения (GoogleTest)
// ==============================================================================
//
// - равенство int/uint и хеш
// - текстовая форма чисел и коллекций
// - конверсия из RapidJSON
//
// ==============================================================================

#include <factforge/value.hpp>

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <rapidjson/document.h>

namespace factforge::test {

// ==============================================================================
// Равенство и хеш
// ==============================================================================

TEST(ValueTest, IntAndUIntEqualMathematically) {
    Value i(std::int64_t{5});
    Value u(std::uint64_t{5});
    EXPECT_EQ(i, u);
    EXPECT_EQ(i.hash(), u.hash());
}

TEST(ValueTest, NegativeIntNeverEqualsUInt) {
    Value i(std::int64_t{-1});
    Value u(std::numeric_limits<std::uint64_t>::max());
    EXPECT_NE(i, u);
}

TEST(ValueTest, IntegerNotEqualDouble) {
    EXPECT_NE(Value(std::int64_t{25}), Value(25.0));
}

TEST(ValueTest, ObjectEqualityIgnoresInsertionOrder) {
    ValueObject a;
    a["x"] = Value(std::int64_t{1});
    a["y"] = Value("two");
    ValueObject b;
    b["y"] = Value("two");
    b["x"] = Value(std::uint64_t{1});

    Value va(a);
    Value vb(b);
    EXPECT_EQ(va, vb);
    EXPECT_EQ(va.hash(), vb.hash());
}

TEST(ValueTest, ArrayOrderMatters) {
    Value a(ValueArray{Value("a"), Value("b")});
    Value b(ValueArray{Value("b"), Value("a")});
    EXPECT_NE(a, b);
}

TEST(ValueTest, CopyOfCollectionsIsDeep) {
    ValueObject inner;
    inner["k"] = Value("v");
    ValueObject outer;
    outer["list"] = Value(ValueArray{Value("a")});
    outer["map"] = Value(std::move(inner));
    Value original(std::move(outer));

    Value copy = original;
    copy.as_object_mut()["list"].push_back(Value("b"));
    copy.as_object_mut()["map"].set("k", Value("changed"));
    EXPECT_EQ(original.get("list")->array_size(), 1u);
    EXPECT_EQ(*original.get("map")->get("k"), Value("v"));

    Value assigned;
    assigned = original;
    assigned.erase("list");
    EXPECT_TRUE(original.has("list"));
    EXPECT_NE(assigned, original);
}

TEST(ValueTest, NullFactBecomesNull) {
    Value v(FactPtr{});
    EXPECT_TRUE(v.is_null());
}

// ==============================================================================
// Текстовая форма
// ==============================================================================

TEST(ValueTest, ToText_Scalars) {
    EXPECT_EQ(Value().to_text(), "null");
    EXPECT_EQ(Value(true).to_text(), "true");
    EXPECT_EQ(Value(std::int64_t{-42}).to_text(), "-42");
    EXPECT_EQ(Value(std::uint64_t{42}).to_text(), "42");
    EXPECT_EQ(Value("Jane").to_text(), "Jane");
}

TEST(ValueTest, ToText_IntegralDoubleKeepsFraction) {
    EXPECT_EQ(Value(25.0).to_text(), "25.0");
    EXPECT_EQ(Value(2.5).to_text(), "2.5");
    EXPECT_EQ(Value(-0.125).to_text(), "-0.125");
}

TEST(ValueTest, FormatDouble_NonFinite) {
    EXPECT_EQ(format_double(std::nan("")), "NaN");
    EXPECT_EQ(format_double(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(format_double(-std::numeric_limits<double>::infinity()), "-Infinity");
}

TEST(ValueTest, ToText_Collections) {
    Value arr(ValueArray{Value("a"), Value(std::int64_t{1})});
    EXPECT_EQ(arr.to_text(), "[a, 1]");

    ValueObject obj;
    obj["b"] = Value("x");
    obj["a"] = Value(std::int64_t{1});
    EXPECT_EQ(Value(obj).to_text(), "{a=1, b=x}");
}

TEST(ValueTest, TypeNames) {
    EXPECT_STREQ(Value().type_name(), "null");
    EXPECT_STREQ(Value(std::int64_t{1}).type_name(), "integer");
    EXPECT_STREQ(Value(1.0).type_name(), "double");
    EXPECT_STREQ(Value::make_array().type_name(), "list");
    EXPECT_STREQ(Value::make_object().type_name(), "map");
}

// ==============================================================================
// RapidJSON
// ==============================================================================

TEST(ValueTest, FromRapidjson_NumberKinds) {
    rapidjson::Document doc;
    doc.Parse(R"({"a": 1, "b": -2, "c": 1.5, "d": [true, null], "e": "s"})");
    ASSERT_FALSE(doc.HasParseError());

    Value v = Value::from_rapidjson(doc);
    ASSERT_TRUE(v.is_object());
    EXPECT_TRUE(v.get("a")->is_uint());
    EXPECT_TRUE(v.get("b")->is_int());
    EXPECT_TRUE(v.get("c")->is_double());
    ASSERT_TRUE(v.get("d")->is_array());
    EXPECT_EQ(v.get("d")->array_size(), 2u);
    EXPECT_TRUE(v.get("d")->at(1)->is_null());
    EXPECT_EQ(v.get("e")->as_string(), "s");
}

TEST(ValueTest, ToRapidjson_PreservesStructure) {
    ValueObject obj;
    obj["name"] = Value("Jane");
    obj["tags"] = Value(ValueArray{Value(std::int64_t{1}), Value(2.5)});

    rapidjson::Document doc = Value(obj).to_rapidjson_document();
    ASSERT_TRUE(doc.IsObject());
    EXPECT_STREQ(doc["name"].GetString(), "Jane");
    ASSERT_TRUE(doc["tags"].IsArray());
    EXPECT_EQ(doc["tags"][0].GetInt64(), 1);
    EXPECT_DOUBLE_EQ(doc["tags"][1].GetDouble(), 2.5);
}

TEST(ValueTest, ToRapidjson_RejectsNonFiniteDouble) {
    Value v(std::numeric_limits<double>::infinity());
    EXPECT_THROW(v.to_rapidjson_document(), std::runtime_error);
}

}  // namespace factforge::test
