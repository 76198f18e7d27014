// ==============================================================================
// test_facade_gtest.cpp - Тесты фасада материализации (GoogleTest)
// ==============================================================================
//
// - сценарий Person: приведение, значения по умолчанию, обязательные поля
// - пакеты: пустой массив, изоляция ошибок, позиция элемента
// - автоопределение схемы по дискриминатору
// - эквивалентность стратегий, fallback только при недоступном компиляторе
// - вложенные схемы, повторная регистрация
//
// ==============================================================================

#include <factforge/error.hpp>
#include <factforge/facade.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

namespace factforge::test {

namespace {

namespace fs = std::filesystem;

const char* kDefinitions = R"(
declare Address
    city : String @required
    zip : String
end

declare Person
    name : String @required
    age : int
    adult : boolean = false
    status : String = "active"
    scores : java.util.List<Integer>
    address : Address
end

declare Account
    id : long @required
    name : String @required
    note : String
end
)";

class UnavailableCompiler : public TypeCompiler {
public:
    bool available() const override { return false; }
    std::string name() const override { return "absent"; }
    CompileResult compile(std::string_view) const override { return {}; }
};

FacadeOptions with_strategy(Strategy s) {
    FacadeOptions o;
    o.strategy = s;
    return o;
}

/// Временный файл журнала
class TempLog {
public:
    TempLog() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() / ("factforge_facade_" + std::to_string(stamp) + ".log");
    }
    ~TempLog() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const fs::path& path() const { return path_; }

    std::string read() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    fs::path path_;
};

std::size_t count_of(const std::string& text, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

}  // namespace

class FacadeTest : public ::testing::TestWithParam<Strategy> {
protected:
    void SetUp() override {
        facade_ = std::make_unique<MaterializationFacade>(nullptr, with_strategy(GetParam()));
        facade_->load_definitions(kDefinitions);
    }

    std::unique_ptr<MaterializationFacade> facade_;
};

// ==============================================================================
// Сценарий Person
// ==============================================================================

TEST_P(FacadeTest, Person_DefaultsAndCoercion) {
    auto facts = facade_->from_json(R"([{"name":"Jane","age":16},{"name":"Alice","age":"25"}])",
                                    "Person");
    ASSERT_EQ(facts.size(), 2u);

    EXPECT_EQ(facts[0]->strategy(), GetParam());
    EXPECT_EQ(facts[0]->get("name"), Value("Jane"));
    EXPECT_EQ(facts[0]->get("age"), Value(std::int64_t{16}));
    EXPECT_EQ(facts[0]->get("adult"), Value(false));
    EXPECT_EQ(facts[0]->get("status"), Value("active"));
    EXPECT_TRUE(facts[0]->get("address").is_null());

    EXPECT_EQ(facts[1]->invoke("getAge"), Value(std::int64_t{25}));
}

TEST_P(FacadeTest, Person_SingleObjectTopLevel) {
    auto facts = facade_->from_json(R"({"name":"Jane","adult":"true","status":"retired"})",
                                    "Person");
    ASSERT_EQ(facts.size(), 1u);
    EXPECT_EQ(facts[0]->invoke("isAdult"), Value(true));
    EXPECT_EQ(facts[0]->get("status"), Value("retired"));
}

TEST_P(FacadeTest, ListPromotion) {
    auto facts = facade_->from_json(R"({"name":"Jane","scores":95})", "Person");
    EXPECT_EQ(facts[0]->get("scores"), Value(ValueArray{Value(std::int64_t{95})}));

    facts = facade_->from_json(R"({"name":"Jane","scores":["1", 2]})", "Person");
    EXPECT_EQ(facts[0]->get("scores"),
              Value(ValueArray{Value(std::int64_t{1}), Value(std::int64_t{2})}));
}

TEST_P(FacadeTest, MissingRequired_ListsEveryField) {
    try {
        facade_->from_json(R"({"note":"x"})", "Account");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.schema_name(), "Account");
        EXPECT_EQ(e.missing_fields(), (std::vector<std::string>{"id", "name"}));
        EXPECT_NE(std::string(e.what()).find("[id, name]"), std::string::npos);
    }
}

TEST_P(FacadeTest, RequiredFieldWithExplicitNullIsMissing) {
    EXPECT_THROW(facade_->from_json(R"({"id":1,"name":null})", "Account"), ValidationError);
}

TEST_P(FacadeTest, CoercionErrorPropagates) {
    try {
        facade_->from_json(R"({"name":"Jane","age":"old"})", "Person");
        FAIL() << "expected CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_EQ(e.field(), "age");
    }
}

TEST_P(FacadeTest, UnknownKeysIgnored) {
    auto facts = facade_->from_json(R"({"name":"Jane","nickname":"J"})", "Person");
    ASSERT_EQ(facts.size(), 1u);
    EXPECT_FALSE(facts[0]->schema().has_field("nickname"));
}

// ==============================================================================
// Вложенные схемы
// ==============================================================================

TEST_P(FacadeTest, NestedReference) {
    auto facts = facade_->from_json(
        R"({"name":"Jane","address":{"city":"Oslo","zip":1234}})", "Person");
    const Value& address = facts[0]->get("address");
    ASSERT_TRUE(address.is_fact());
    EXPECT_EQ(address.get_fact()->schema_name(), "Address");
    EXPECT_EQ(address.get_fact()->strategy(), GetParam());
    EXPECT_EQ(facts[0]->find("address.zip"), std::optional<Value>(Value("1234")));
}

TEST_P(FacadeTest, NestedValidationFailureSurfaces) {
    EXPECT_THROW(facade_->from_json(R"({"name":"Jane","address":{"zip":"1"}})", "Person"),
                 ValidationError);
}

// ==============================================================================
// Пакеты
// ==============================================================================

TEST_P(FacadeTest, EmptyArrayYieldsNoFacts) {
    EXPECT_TRUE(facade_->from_json("[]", "Person").empty());
    EXPECT_TRUE(facade_->from_json_auto_detect("[]").empty());
    EXPECT_TRUE(facade_->from_json_each("[]", "Person").empty());
}

TEST_P(FacadeTest, Batch_FirstErrorCarriesPosition) {
    try {
        facade_->from_json(R"([{"name":"A"},{"age":3},{"name":"C"}])", "Person");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_TRUE(e.element_index().has_value());
        EXPECT_EQ(*e.element_index(), 1u);
    }
}

TEST_P(FacadeTest, BatchEach_IsolatesFailures) {
    auto results = facade_->from_json_each(
        R"([{"name":"A"},{"name":"B","age":"x"},{"name":"C"}])", "Person");
    ASSERT_EQ(results.size(), 3u);

    EXPECT_TRUE(results[0]);
    EXPECT_FALSE(results[1]);
    EXPECT_TRUE(results[2]);
    EXPECT_EQ(results[2].fact->get("name"), Value("C"));

    EXPECT_EQ(results[1].index, 1u);
    EXPECT_NE(results[1].error_message().find("'age'"), std::string::npos);
    EXPECT_TRUE(results[0].error_message().empty());
    try {
        std::rethrow_exception(results[1].error);
    } catch (const CoercionError& e) {
        EXPECT_EQ(e.element_index(), std::optional<std::size_t>(1));
    }
}

TEST_P(FacadeTest, NonObjectElementIsValidationError) {
    try {
        facade_->from_json(R"([{"name":"A"}, 7])", "Person");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.element_index(), std::optional<std::size_t>(1));
        EXPECT_NE(std::string(e.what()).find("got integer"), std::string::npos);
    }
}

// ==============================================================================
// Автоопределение
// ==============================================================================

TEST_P(FacadeTest, AutoDetect_UsesDiscriminator) {
    auto facts = facade_->from_json_auto_detect(
        R"([{"_type":"Person","name":"Jane"},{"_type":"Address","city":"Oslo"}])");
    ASSERT_EQ(facts.size(), 2u);
    EXPECT_EQ(facts[0]->schema_name(), "Person");
    EXPECT_EQ(facts[1]->schema_name(), "Address");
}

TEST_P(FacadeTest, AutoDetect_MissingOrUnknownDiscriminator) {
    EXPECT_THROW(facade_->from_json_auto_detect(R"({"name":"Jane"})"), SchemaNotFoundError);
    try {
        facade_->from_json_auto_detect(R"([{"_type":"Person","name":"A"},{"_type":"Robot"}])");
        FAIL() << "expected SchemaNotFoundError";
    } catch (const SchemaNotFoundError& e) {
        EXPECT_EQ(e.schema_name(), "Robot");
        EXPECT_EQ(e.element_index(), std::optional<std::size_t>(1));
    }
}

TEST_P(FacadeTest, ExplicitSchemaIgnoresDiscriminator) {
    auto facts = facade_->from_json(R"({"_type":"Address","name":"Jane"})", "Person");
    EXPECT_EQ(facts[0]->schema_name(), "Person");
}

TEST_P(FacadeTest, UnknownSchema) {
    EXPECT_THROW(facade_->from_json(R"({"a":1})", "Robot"), SchemaNotFoundError);
}

// ==============================================================================
// Некорректный JSON
// ==============================================================================

TEST_P(FacadeTest, InvalidJson) {
    try {
        facade_->from_json(R"([{"name":"Jane"},)", "Person");
        FAIL() << "expected JsonParseError";
    } catch (const JsonParseError& e) {
        EXPECT_GT(e.offset(), 0u);
    }
    EXPECT_THROW(facade_->from_json("42", "Person"), JsonParseError);
    EXPECT_THROW(facade_->from_json_each("\"text\"", "Person"), JsonParseError);
}

// ==============================================================================
// Имена полей и изоляция значений
// ==============================================================================

TEST_P(FacadeTest, KeywordLikeFieldNames) {
    ObjectSchema call("Call");
    call.add_field("method", FieldType::String, true);
    call.add_field("ref", FieldType::String);
    call.add_field("field", FieldType::Integer);
    call.add_field("getter", FieldType::String);
    call.add_field("setter", FieldType::String);
    call.add_field("constructor", FieldType::String);
    facade_->register_schema(std::move(call));

    auto facts = facade_->from_json(
        R"({"method":"GET","ref":"r1","field":"7","getter":"g","setter":"s","constructor":"c"})",
        "Call");
    ASSERT_EQ(facts.size(), 1u);
    EXPECT_EQ(facts[0]->strategy(), GetParam());
    EXPECT_EQ(facts[0]->invoke("getMethod"), Value("GET"));
    EXPECT_EQ(facts[0]->get("field"), Value(std::int64_t{7}));
    EXPECT_EQ(facts[0]->invoke("getConstructor"), Value("c"));

    facts[0]->invoke("setRef", {Value("r2")});
    EXPECT_EQ(facts[0]->get("ref"), Value("r2"));
}

TEST_P(FacadeTest, FactDoesNotShareStorageWithInputOrCopies) {
    ObjectSchema bag("Bag");
    bag.add_field("tags", FieldType::List);
    bag.add_field("attrs", FieldType::Map);
    facade_->register_schema(std::move(bag));

    ValueObject attrs;
    attrs["k"] = Value("v");
    ValueObject fields;
    fields["tags"] = Value(ValueArray{Value("a")});
    fields["attrs"] = Value(std::move(attrs));
    Value input(std::move(fields));

    auto fact = facade_->from_value(input, "Bag");
    const std::size_t hash_before = fact->hash();

    input.as_object_mut()["attrs"].as_object_mut()["k"] = Value("CHANGED");
    input.as_object_mut()["tags"].push_back(Value("x"));
    Value tags = fact->get("tags");
    tags.push_back(Value("b"));

    EXPECT_EQ(fact->to_string(), "Bag{tags=[a], attrs={k=v}}");
    EXPECT_EQ(fact->hash(), hash_before);
}

TEST_P(FacadeTest, SetterWithNullClearsFieldWithDefault) {
    auto facts = facade_->from_json(R"({"name":"Jane"})", "Person");
    ASSERT_EQ(facts[0]->get("status"), Value("active"));

    facts[0]->set("status", Value());
    EXPECT_TRUE(facts[0]->get("status").is_null());

    facts[0]->invoke("setAdult", {Value()});
    EXPECT_TRUE(facts[0]->invoke("isAdult").is_null());
}

INSTANTIATE_TEST_SUITE_P(Strategies, FacadeTest,
                         ::testing::Values(Strategy::Compiled, Strategy::Proxy));

// ==============================================================================
// Стратегии и fallback
// ==============================================================================

TEST(FacadeStrategyTest, CompiledAndProxyFactsAreEqual) {
    auto registry = std::make_shared<SchemaRegistry>();
    registry->load(kDefinitions);

    MaterializationFacade compiled(registry, with_strategy(Strategy::Compiled));
    MaterializationFacade proxy(registry, with_strategy(Strategy::Proxy));

    const char* json = R"({"name":"Jane","age":16,"address":{"city":"Oslo"}})";
    auto a = compiled.from_json(json, "Person").front();
    auto b = proxy.from_json(json, "Person").front();

    EXPECT_EQ(a->strategy(), Strategy::Compiled);
    EXPECT_EQ(b->strategy(), Strategy::Proxy);
    EXPECT_TRUE(a->equals(*b));
    EXPECT_EQ(a->hash(), b->hash());
    EXPECT_EQ(a->to_string(), b->to_string());
}

TEST(FacadeStrategyTest, FallbackWhenCompilerUnavailable) {
    TempLog log;
    output::Writer writer(output::OutputConfig{false, 0, log.path()});

    MaterializationFacade facade(nullptr, {}, std::make_shared<UnavailableCompiler>(), &writer);
    facade.load_definitions(kDefinitions);

    auto first = facade.from_json(R"({"name":"A"})", "Person");
    auto second = facade.from_json(R"({"name":"B"})", "Person");
    EXPECT_EQ(first[0]->strategy(), Strategy::Proxy);
    EXPECT_EQ(second[0]->strategy(), Strategy::Proxy);

    writer.flush();
    std::string text = log.read();
    EXPECT_EQ(count_of(text, "falling back to proxy facts"), 1u);
    EXPECT_NE(text.find("[!] type compiler 'absent' is not available"), std::string::npos);
}

TEST(FacadeStrategyTest, NoFallbackWhenDisabled) {
    FacadeOptions options;
    options.fallback_to_proxy = false;
    MaterializationFacade facade(nullptr, options, std::make_shared<UnavailableCompiler>());
    facade.load_definitions(kDefinitions);

    try {
        facade.from_json(R"({"name":"A"})", "Person");
        FAIL() << "expected MaterializationError";
    } catch (const MaterializationError& e) {
        EXPECT_TRUE(e.compiler_unavailable());
    }
}

TEST(FacadeStrategyTest, CompileFailureNeverFallsBack) {
    MaterializationFacade facade;
    ObjectSchema contact("Contact");
    contact.add_field("first-name", FieldType::String);
    facade.register_schema(contact);

    try {
        facade.from_json(R"({"first-name":"Jane"})", "Contact");
        FAIL() << "expected MaterializationError";
    } catch (const MaterializationError& e) {
        EXPECT_EQ(e.kind(), MaterializationError::Kind::CompileFailed);
        EXPECT_NE(std::string(e.what()).find("first-name"), std::string::npos);
        EXPECT_FALSE(e.source().empty());
    }

    FacadeOptions proxy_options;
    proxy_options.strategy = Strategy::Proxy;
    MaterializationFacade proxy(nullptr, proxy_options);
    proxy.register_schema(contact);
    auto facts = proxy.from_json(R"({"first-name":"Jane"})", "Contact");
    EXPECT_EQ(facts[0]->get("first-name"), Value("Jane"));
}

// ==============================================================================
// Регистрация
// ==============================================================================

TEST(FacadeRegistrationTest, ReRegisterProducesFreshType) {
    MaterializationFacade facade;
    facade.register_schema("Person", "declare", "declare Person name : String end");

    auto before = facade.from_json(R"({"name":"A","email":"a@x"})", "Person");
    EXPECT_FALSE(before[0]->schema().has_field("email"));

    facade.register_schema("Person", "declare",
                           "declare Person name : String email : String end");
    auto after = facade.from_json(R"({"name":"A","email":"a@x"})", "Person");
    EXPECT_EQ(after[0]->get("email"), Value("a@x"));
    EXPECT_EQ(after[0]->invoke("getEmail"), Value("a@x"));
    EXPECT_EQ(facade.class_materializer().compile_count(), 2u);

    // Старый факт остаётся со своей схемой
    EXPECT_THROW(before[0]->get("email"), FieldNotFoundError);
}

TEST(FacadeRegistrationTest, CompilesOncePerSchema) {
    MaterializationFacade facade;
    facade.load_definitions(kDefinitions);
    facade.from_json(R"([{"name":"A"},{"name":"B"},{"name":"C"}])", "Person");
    facade.from_json(R"({"name":"D"})", "Person");
    EXPECT_EQ(facade.class_materializer().compile_count(), 1u);
}

TEST(FacadeRegistrationTest, CustomDiscriminator) {
    FacadeOptions options;
    options.discriminator = "kind";
    MaterializationFacade facade(nullptr, options);
    facade.load_definitions(kDefinitions);

    auto facts = facade.from_json_auto_detect(R"({"kind":"Address","city":"Oslo"})");
    EXPECT_EQ(facts[0]->schema_name(), "Address");

    options.discriminator = "";
    EXPECT_THROW(MaterializationFacade rejected(nullptr, options), std::invalid_argument);
}

TEST(FacadeRegistrationTest, MaterializeFromValues) {
    MaterializationFacade facade;
    facade.load_definitions(kDefinitions);

    ValueObject fields;
    fields["name"] = Value("Jane");
    fields["age"] = Value("30");
    auto fact = facade.materialize("Person", fields);
    EXPECT_EQ(fact->get("age"), Value(std::int64_t{30}));

    auto parsed = parse_json(R"({"_type":"Address","city":"Oslo"})");
    EXPECT_EQ(facade.from_value_auto_detect(parsed)->schema_name(), "Address");
    EXPECT_EQ(facade.from_value(parsed, "Address")->get("city"), Value("Oslo"));
}

TEST(FacadeRegistrationTest, DeclarativeTextUsesNamespace) {
    FacadeOptions options;
    options.ns = "org.example";
    MaterializationFacade facade(nullptr, options);
    facade.load_definitions(kDefinitions);

    auto text = facade.declarative_text();
    EXPECT_EQ(text.rfind("package org.example;\n\n", 0), 0u);
    EXPECT_NE(text.find("declare Person"), std::string::npos);
}

TEST(FacadeRegistrationTest, FromConfigLoadsDefinitions) {
    Config config;
    config.strategy = Strategy::Proxy;
    config.log.quiet = true;
    config.definitions = kDefinitions;

    auto facade = MaterializationFacade::from_config(config);
    EXPECT_TRUE(facade->registry().contains("Person"));
    EXPECT_EQ(facade->options().strategy, Strategy::Proxy);

    auto facts = facade->from_json(R"({"name":"Jane"})", "Person");
    EXPECT_EQ(facts[0]->strategy(), Strategy::Proxy);
}

TEST(FacadeRegistrationTest, FromConfigRejectsBadDefinitions) {
    Config config;
    config.log.quiet = true;
    config.definitions = "declare Broken a : int";
    EXPECT_THROW(MaterializationFacade::from_config(config), std::invalid_argument);
}

}  // namespace factforge::test
