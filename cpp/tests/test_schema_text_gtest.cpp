// ==============================================================================
// test_schema_text_gtest.cpp - Тесты declare-текста (GoogleTest)
// ==============================================================================
//
// - имена типов полей и generic-подсказки
// - многострочная и однострочная форма declare
// - литералы по умолчанию, @required
// - разбиение документа определений на блоки
//
// ==============================================================================

#include <factforge/schema_text.hpp>

#include <gtest/gtest.h>
#include <stdexcept>

namespace factforge::test {

// ==============================================================================
// Имена типов
// ==============================================================================

TEST(SchemaTextTest, TypeNames_Primitives) {
    EXPECT_EQ(parse_type_name("String").type, FieldType::String);
    EXPECT_EQ(parse_type_name("int").type, FieldType::Integer);
    EXPECT_EQ(parse_type_name("java.lang.Integer").type, FieldType::Integer);
    EXPECT_EQ(parse_type_name("short").type, FieldType::Integer);
    EXPECT_EQ(parse_type_name("long").type, FieldType::Long);
    EXPECT_EQ(parse_type_name("float").type, FieldType::Double);
    EXPECT_EQ(parse_type_name("Number").type, FieldType::Double);
    EXPECT_EQ(parse_type_name("boolean").type, FieldType::Boolean);
    EXPECT_EQ(parse_type_name("java.util.Map").type, FieldType::Map);
}

TEST(SchemaTextTest, TypeNames_GenericList) {
    auto ref = parse_type_name("java.util.List< Address >");
    EXPECT_EQ(ref.type, FieldType::List);
    EXPECT_EQ(ref.element_type, "Address");

    auto plain = parse_type_name("List");
    EXPECT_EQ(plain.type, FieldType::List);
    EXPECT_TRUE(plain.element_type.empty());

    EXPECT_EQ(parse_type_name("Map<String, Object>").type, FieldType::Map);
}

TEST(SchemaTextTest, TypeNames_OtherIdentifierIsReference) {
    auto ref = parse_type_name("Address");
    EXPECT_EQ(ref.type, FieldType::Object);
    EXPECT_EQ(ref.object_type, "Address");
}

TEST(SchemaTextTest, TypeNames_Malformed) {
    EXPECT_THROW(parse_type_name(""), std::invalid_argument);
    EXPECT_THROW(parse_type_name("List<A, B>"), std::invalid_argument);
    EXPECT_THROW(parse_type_name("int<String>"), std::invalid_argument);
    EXPECT_THROW(parse_type_name("Foo<Bar>"), std::invalid_argument);
}

// ==============================================================================
// Литералы
// ==============================================================================

TEST(SchemaTextTest, Literals) {
    EXPECT_EQ(parse_literal("\"active\""), Value("active"));
    EXPECT_EQ(parse_literal("\"a\\\"b\""), Value("a\"b"));
    EXPECT_EQ(parse_literal("42"), Value(std::int64_t{42}));
    EXPECT_EQ(parse_literal("-1.5"), Value(-1.5));
    EXPECT_EQ(parse_literal("true"), Value(true));
    EXPECT_TRUE(parse_literal("null").is_null());
    EXPECT_THROW(parse_literal("active"), std::invalid_argument);
}

TEST(SchemaTextTest, RenderLiteral_QuotesStrings) {
    EXPECT_EQ(render_literal(Value("say \"hi\"")), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(render_literal(Value(25.0)), "25.0");
    EXPECT_EQ(render_literal(Value(false)), "false");
}

// ==============================================================================
// declare
// ==============================================================================

TEST(SchemaTextTest, Declare_MultiLine) {
    auto s = parse_declare(R"(
        declare Person
            name : String @required
            age : int
            adult : boolean = false
            status : String = "active"
            address : Address
            tags : java.util.List<String>
        end
    )");

    EXPECT_EQ(s.name(), "Person");
    ASSERT_EQ(s.field_count(), 6u);
    EXPECT_TRUE(s.field("name")->required);
    EXPECT_EQ(s.field("age")->type, FieldType::Integer);
    EXPECT_EQ(s.field("adult")->default_value, Value(false));
    EXPECT_EQ(s.field("status")->default_value, Value("active"));
    EXPECT_EQ(s.field("address")->object_type, "Address");
    EXPECT_EQ(s.field("tags")->element_type, "String");
}

TEST(SchemaTextTest, Declare_SingleLine) {
    auto s = parse_declare("declare Person name : String age : int adult : boolean = false end");
    ASSERT_EQ(s.field_count(), 3u);
    EXPECT_EQ(s.fields()[2].name, "adult");
    EXPECT_EQ(s.fields()[2].default_value, Value(false));
}

TEST(SchemaTextTest, Declare_CompactColons) {
    auto s = parse_declare("declare Person name: String age: int end");
    ASSERT_EQ(s.field_count(), 2u);
    EXPECT_EQ(s.field("age")->type, FieldType::Integer);
}

TEST(SchemaTextTest, Declare_SkipsTypeAnnotationsAndComments) {
    auto s = parse_declare(R"(
        declare Reading
            @role( event )
            // показания датчика
            value : double = 0
            sensor : String @key
        end
    )");
    ASSERT_EQ(s.field_count(), 2u);
    EXPECT_EQ(s.field("value")->default_value, Value(0.0));
    EXPECT_TRUE(s.field("sensor")->required);
}

TEST(SchemaTextTest, Declare_DefaultMustMatchType) {
    EXPECT_THROW(parse_declare("declare P age : int = \"old\" end"), std::invalid_argument);
    EXPECT_THROW(parse_declare("declare P flag : boolean = 3 end"), std::invalid_argument);
}

TEST(SchemaTextTest, Declare_Errors) {
    EXPECT_THROW(parse_declare("declare Person name : String"), std::invalid_argument);
    EXPECT_THROW(parse_declare("declare Person name String end"), std::invalid_argument);
    EXPECT_THROW(parse_declare("rule Person end"), std::invalid_argument);
    EXPECT_THROW(parse_declare("declare P a : int a : long end"), std::invalid_argument);
    EXPECT_THROW(parse_declare("declare P a : int end trailing"), std::invalid_argument);
}

TEST(SchemaTextTest, Declare_ErrorMentionsLine) {
    try {
        parse_declare("declare P\n  a : int\n  b : int = x\nend");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
}

TEST(SchemaTextTest, Declare_KeepsNonIdentifierFieldNames) {
    auto s = parse_declare("declare Contact first-name : String end");
    EXPECT_TRUE(s.has_field("first-name"));
}

TEST(SchemaTextTest, RenderDeclare_ParsesBack) {
    ObjectSchema s("Person");
    s.add_field("name", FieldType::String, true);
    s.add_field(FieldSpec("age", FieldType::Integer).with_default(Value(std::int64_t{18})));
    s.add_field(FieldSpec("score", FieldType::Double).with_default(Value(25.0)));
    s.add_field(FieldSpec::reference("address", "Address"));
    s.add_field(FieldSpec::list_of("tags", "String"));
    s.add_field("attrs", FieldType::Map);

    std::string text = render_declare(s);
    EXPECT_EQ(text.rfind("declare Person\n", 0), 0u);
    EXPECT_NE(text.find("    name : String @required\n"), std::string::npos);
    EXPECT_NE(text.find("    tags : java.util.List<String>\n"), std::string::npos);

    auto parsed = parse_declare(text);
    EXPECT_TRUE(parsed.same_content(s));
}

// ==============================================================================
// Документ определений
// ==============================================================================

TEST(SchemaTextTest, SplitDefinitions_AllKinds) {
    auto doc = split_definitions(R"(
package org.example;

import java.util.List;
global java.util.List results;

/* типы */
declare Person
    name : String
end

function int add(int a, int b) {
    if (a > b) { return a; }
    return a + b;
}

rule "Adult check"
when
    $p : Person(age >= 18)
then
    System.out.println("end of rule");
end
)");

    EXPECT_EQ(doc.package, "org.example");
    ASSERT_EQ(doc.blocks.size(), 5u);

    EXPECT_EQ(doc.blocks[0].kind, "import");
    EXPECT_EQ(doc.blocks[0].name, "java.util.List");
    EXPECT_EQ(doc.blocks[0].content, "import java.util.List;");

    EXPECT_EQ(doc.blocks[1].kind, "global");
    EXPECT_EQ(doc.blocks[1].name, "results");

    EXPECT_EQ(doc.blocks[2].kind, "declare");
    EXPECT_EQ(doc.blocks[2].name, "Person");

    EXPECT_EQ(doc.blocks[3].kind, "function");
    EXPECT_EQ(doc.blocks[3].name, "add");
    EXPECT_EQ(doc.blocks[3].content.back(), '}');

    EXPECT_EQ(doc.blocks[4].kind, "rule");
    EXPECT_EQ(doc.blocks[4].name, "Adult check");
    EXPECT_NE(doc.blocks[4].content.find("end of rule"), std::string::npos);
    EXPECT_EQ(doc.blocks[4].content.substr(doc.blocks[4].content.size() - 3), "end");
}

TEST(SchemaTextTest, SplitDefinitions_Errors) {
    EXPECT_THROW(split_definitions("declare Person name : String"), std::invalid_argument);
    EXPECT_THROW(split_definitions("bogus text"), std::invalid_argument);
    EXPECT_THROW(split_definitions("function int f() { return 1;"), std::invalid_argument);
}

}  // namespace factforge::test
