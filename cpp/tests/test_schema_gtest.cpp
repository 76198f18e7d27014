// ==============================================================================
// test_schema_gtest.cpp - Тесты модели схем (GoogleTest)
// ==============================================================================

#include <factforge/schema.hpp>

#include <gtest/gtest.h>
#include <stdexcept>

namespace factforge::test {

namespace {

ObjectSchema person_schema() {
    ObjectSchema s("Person");
    s.add_field("name", FieldType::String, true);
    s.add_field("age", FieldType::Integer);
    s.add_field(FieldSpec("adult", FieldType::Boolean).with_default(Value(false)));
    s.add_field(FieldSpec::reference("address", "Address"));
    return s;
}

}  // namespace

// ==============================================================================
// FieldSpec
// ==============================================================================

TEST(SchemaTest, AccessorNames_BooleanUsesIs) {
    EXPECT_EQ(FieldSpec("adult", FieldType::Boolean).getter_name(), "isAdult");
    EXPECT_EQ(FieldSpec("name", FieldType::String).getter_name(), "getName");
    EXPECT_EQ(FieldSpec("firstName", FieldType::String).setter_name(), "setFirstName");
}

TEST(SchemaTest, FieldSpec_Classification) {
    EXPECT_TRUE(FieldSpec("a", FieldType::Long).is_primitive());
    EXPECT_FALSE(FieldSpec("a", FieldType::List).is_primitive());
    EXPECT_TRUE(FieldSpec("a", FieldType::Map).is_collection());
    EXPECT_FALSE(FieldSpec("a", FieldType::String).has_default());
    EXPECT_TRUE(FieldSpec("a", FieldType::String).with_default(Value("x")).has_default());
}

TEST(SchemaTest, ListOf_KeepsElementHint) {
    auto f = FieldSpec::list_of("addresses", "Address");
    EXPECT_EQ(f.type, FieldType::List);
    EXPECT_EQ(f.element_type, "Address");
}

// ==============================================================================
// ObjectSchema
// ==============================================================================

TEST(SchemaTest, Schema_KeepsDeclarationOrder) {
    auto s = person_schema();
    ASSERT_EQ(s.field_count(), 4u);
    EXPECT_EQ(s.field_names(), (std::vector<std::string>{"name", "age", "adult", "address"}));
    EXPECT_EQ(*s.index_of("adult"), 2u);
    EXPECT_FALSE(s.index_of("missing").has_value());
}

TEST(SchemaTest, Schema_RejectsEmptyOrSpacedName) {
    EXPECT_THROW(ObjectSchema(""), std::invalid_argument);
    EXPECT_THROW(ObjectSchema("Bad Name"), std::invalid_argument);
}

TEST(SchemaTest, Schema_RejectsDuplicateField) {
    ObjectSchema s("Point");
    s.add_field("x", FieldType::Integer);
    EXPECT_THROW(s.add_field("x", FieldType::Long), std::invalid_argument);
}

TEST(SchemaTest, Schema_RejectsReferenceWithoutTarget) {
    ObjectSchema s("Order");
    EXPECT_THROW(s.add_field("customer", FieldType::Object), std::invalid_argument);
}

TEST(SchemaTest, MissingRequired_TreatsNullAsMissing) {
    ObjectSchema s("Account");
    s.add_field("id", FieldType::Long, true);
    s.add_field("name", FieldType::String, true);
    s.add_field("note", FieldType::String);

    ValueObject data;
    data["name"] = Value();
    data["note"] = Value("x");
    EXPECT_EQ(s.missing_required(data), (std::vector<std::string>{"id", "name"}));

    data["id"] = Value(std::int64_t{7});
    data["name"] = Value("acme");
    EXPECT_TRUE(s.missing_required(data).empty());
}

TEST(SchemaTest, QualifiedName_UsesNamespace) {
    ObjectSchema s("Person", "org.example");
    EXPECT_EQ(s.qualified_name(), "org.example.Person");
    s.set_ns("");
    EXPECT_EQ(s.qualified_name(), "Person");
}

TEST(SchemaTest, SameContent_IgnoresRevision) {
    auto a = person_schema();
    auto b = person_schema();
    b.set_revision(9);
    EXPECT_TRUE(a.same_content(b));
    b.add_field("email", FieldType::String);
    EXPECT_FALSE(a.same_content(b));
}

TEST(SchemaTest, Summary_ListsRequiredFields) {
    auto text = person_schema().summary();
    EXPECT_NE(text.find("Person"), std::string::npos);
    EXPECT_NE(text.find("name (string) [REQUIRED]"), std::string::npos);
    EXPECT_NE(text.find("address (object Address)"), std::string::npos);
}

// ==============================================================================
// Name utilities
// ==============================================================================

TEST(SchemaTest, NameUtilities) {
    EXPECT_EQ(capitalize("name"), "Name");
    EXPECT_EQ(decapitalize("FirstName"), "firstName");
    EXPECT_EQ(capitalize(""), "");
    EXPECT_TRUE(is_identifier("first_name2"));
    EXPECT_FALSE(is_identifier("first-name"));
    EXPECT_FALSE(is_identifier("2nd"));
    EXPECT_TRUE(is_valid_schema_name("org.Person"));
    EXPECT_FALSE(is_valid_schema_name("a b"));
}

}  // namespace factforge::test
