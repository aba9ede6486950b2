#include <gtest/gtest.h>
#include <pickler/errors.hpp>
#include <pickler/pickler.hpp>
#include <pickler/type_expr.hpp>

#include "test_models.hpp"

#include <list>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace pickler;

TEST(TypeExprTest, ScalarKinds) {
    static_assert(value_kind_of<bool>() == ValueKind::Bool);
    static_assert(value_kind_of<uint8_t>() == ValueKind::Byte);
    static_assert(value_kind_of<char16_t>() == ValueKind::Char);
    static_assert(value_kind_of<uint32_t>() == ValueKind::Int32);
    static_assert(value_kind_of<uint64_t>() == ValueKind::Int64);
    static_assert(value_kind_of<std::string>() == ValueKind::String);
    static_assert(value_kind_of<Uuid>() == ValueKind::Uuid);
    static_assert(value_kind_of<models::Color>() == ValueKind::Enum);
    static_assert(value_kind_of<models::Person>() == ValueKind::Structured);
    static_assert(value_kind_of<models::Tree>() == ValueKind::ClosedVariant);
    static_assert(!value_kind_of<models::Undescribed>().has_value());
    static_assert(!value_kind_of<const char*>().has_value());
}

TEST(TypeExprTest, TreeStrings) {
    EXPECT_EQ((analyze<int32_t, void>("t").to_tree_string()), "int32");
    EXPECT_EQ((analyze<std::vector<int32_t>, void>("t").to_tree_string()), "ARRAY(int32)");
    EXPECT_EQ((analyze<std::list<std::optional<std::string>>, void>("t").to_tree_string()),
              "LIST(OPTIONAL(string))");
    EXPECT_EQ((analyze<std::map<std::string, models::Person>, void>("t").to_tree_string()),
              "MAP(string, models.Person)");
    EXPECT_EQ((analyze<std::vector<std::vector<models::Color>>, void>("t").to_tree_string()),
              "ARRAY(ARRAY(models.Color))");
    EXPECT_EQ((analyze<models::Tree, void>("t").to_tree_string()),
              "variant<models.InternalNode|models.LeafNode>");
}

TEST(TypeExprTest, NodeStructure) {
    TypeExpr t = analyze<std::map<int64_t, std::deque<models::Person>>, void>("t");
    ASSERT_EQ(t.kind(), TypeExpr::Kind::Map);
    EXPECT_TRUE(t.is_container());
    EXPECT_EQ(t.key().value_kind(), ValueKind::Int64);
    ASSERT_EQ(t.mapped().kind(), TypeExpr::Kind::List);
    const TypeExpr& person = t.mapped().element();
    EXPECT_EQ(person.kind(), TypeExpr::Kind::Value);
    EXPECT_EQ(person.value_kind(), ValueKind::Structured);
    EXPECT_EQ(person.type_name(), "models.Person");
    EXPECT_FALSE(person.boxed());

    EXPECT_THROW(t.element(), Error);
    EXPECT_THROW(person.key(), Error);
}

TEST(TypeExprTest, BoxedAndSameType) {
    TypeExpr next = analyze<std::shared_ptr<const models::Link>, models::Link>("models.Link");
    EXPECT_TRUE(next.boxed());
    EXPECT_TRUE(next.same_type());

    TypeExpr other = analyze<std::shared_ptr<const models::Link>, models::Person>("models.Person");
    EXPECT_TRUE(other.boxed());
    EXPECT_FALSE(other.same_type());

    TypeExpr children = analyze<std::vector<models::Family>, models::Family>("models.Family");
    EXPECT_TRUE(children.element().same_type());
    EXPECT_FALSE(children.element().boxed());
}

TEST(TypeExprTest, Equality) {
    EXPECT_EQ((analyze<std::vector<int32_t>, void>("a")), (analyze<std::vector<uint32_t>, void>("b")));
    EXPECT_EQ((analyze<std::list<double>, void>("a")), (analyze<std::deque<double>, void>("b")));
    EXPECT_NE((analyze<std::vector<int32_t>, void>("a")), (analyze<std::list<int32_t>, void>("a")));
}

TEST(TypeExprTest, UnsupportedTypes) {
    EXPECT_THROW((analyze<const models::Person*, void>("t")), ConfigurationError);
    EXPECT_THROW((analyze<std::set<int32_t>, void>("t")), ConfigurationError);
    EXPECT_THROW((analyze<std::shared_ptr<const int32_t>, void>("t")), ConfigurationError);
    EXPECT_THROW((analyze<std::vector<models::Undescribed>, void>("t")), ConfigurationError);
}

TEST(TypeExprTest, UnsupportedFieldsFailPicklerConstruction) {
    EXPECT_THROW(Pickler<models::WithPointer>{Config{}}, ConfigurationError);
    EXPECT_THROW(Pickler<models::WithSet>{Config{}}, ConfigurationError);
    EXPECT_THROW(Pickler<models::WithBoxedInt>{Config{}}, ConfigurationError);
    EXPECT_THROW(Pickler<models::WithUndescribed>{Config{}}, ConfigurationError);
}

TEST(TypeExprTest, VariantMembersMustBeUserTypes) {
    try {
        Pickler<models::WithPrimitiveVariant> pickler{Config{}};
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("int32"), std::string::npos);
    }
}
