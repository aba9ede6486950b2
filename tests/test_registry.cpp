#include <gtest/gtest.h>
#include <pickler/errors.hpp>
#include <pickler/pickler.hpp>
#include <pickler/registry.hpp>

#include "test_models.hpp"

#include <string>
#include <vector>

using namespace pickler;

class RegistryTest : public ::testing::Test {
protected:
    Config config_{};
};

TEST_F(RegistryTest, OrdinalsFollowSortedNames) {
    Pickler<models::Tree> pickler(config_);
    EXPECT_EQ(pickler.table().size(), 2u);
    EXPECT_EQ(pickler.ordinal_of<models::InternalNode>(), 0u);
    EXPECT_EQ(pickler.ordinal_of<models::LeafNode>(), 1u);
    EXPECT_EQ(pickler.type_at(0), "models.InternalNode");
    EXPECT_EQ(pickler.type_at(1), "models.LeafNode");
}

TEST_F(RegistryTest, TransitiveDiscovery) {
    Pickler<models::Message> pickler(config_);
    const std::vector<std::string> expected = {
        "models.Color", "models.Failure", "models.Peek", "models.Pop",
        "models.Push", "models.Success"
    };
    ASSERT_EQ(pickler.table().size(), expected.size());
    for (uint32_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(pickler.type_at(i), expected[i]);
    }
}

TEST_F(RegistryTest, OrdinalsAreDeterministic) {
    Pickler<models::Containers> a(config_);
    Pickler<models::Containers> b(config_);
    ASSERT_EQ(a.table().size(), b.table().size());
    for (uint32_t i = 0; i < a.table().size(); ++i) {
        EXPECT_EQ(a.type_at(i), b.type_at(i));
        EXPECT_EQ(a.table().signature(i), b.table().signature(i));
    }
}

TEST_F(RegistryTest, LookupByName) {
    Pickler<models::Paint> pickler(config_);
    EXPECT_EQ(pickler.table().find_ordinal("models.Color"), 0u);
    EXPECT_EQ(pickler.table().find_ordinal("models.Paint"), 1u);
    EXPECT_FALSE(pickler.table().find_ordinal("models.Person").has_value());
    EXPECT_EQ(pickler.table().root_name(), "models.Paint");
}

TEST_F(RegistryTest, UnknownOrdinal) {
    Pickler<models::Paint> pickler(config_);
    EXPECT_THROW(pickler.type_at(7), DecodeError);
    EXPECT_THROW(pickler.table().entry(2), DecodeError);
}

TEST_F(RegistryTest, DuplicateNamesRejected) {
    try {
        Pickler<models::WithDuplicates> pickler(config_);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("models.Duplicate"), std::string::npos);
    }
}

TEST_F(RegistryTest, InvalidFallbackRejected) {
    EXPECT_THROW(Pickler<models::BadFallback>{config_}, ConfigurationError);
}

TEST_F(RegistryTest, FieldTypesRecorded) {
    Pickler<models::Paint> pickler(config_);
    const TypeEntry& paint = pickler.table().entry(pickler.ordinal_of<models::Paint>());
    ASSERT_EQ(paint.fields.size(), 3u);
    EXPECT_EQ(paint.fields[0].name, "color");
    EXPECT_EQ(paint.fields[0].type.to_tree_string(), "models.Color");
    EXPECT_EQ(paint.fields[1].type.to_tree_string(), "ARRAY(models.Color)");
    EXPECT_EQ(paint.fields[2].type.to_tree_string(), "OPTIONAL(models.Color)");

    const TypeEntry& color = pickler.table().entry(pickler.ordinal_of<models::Color>());
    EXPECT_EQ(color.category, TypeCategory::Enum);
    EXPECT_EQ(color.constants, (std::vector<std::string>{"RED", "GREEN", "BLUE"}));
}

TEST_F(RegistryTest, SignaturesDependOnShape) {
    Pickler<evolution::v3::Record> v3(config_);
    Pickler<evolution::v4::Record> v4(config_);
    Pickler<evolution::v3::Record> v3_again(config_);

    EXPECT_EQ(v3.table().signature(0), v3_again.table().signature(0));
    EXPECT_NE(v3.table().signature(0), v4.table().signature(0));

    Pickler<models::Color> color(config_);
    Pickler<models::ReorderedColor> reordered(config_);
    EXPECT_NE(color.table().signature(0), reordered.table().signature(0));
}

TEST(SimpleNameTest, StripsQualification) {
    EXPECT_EQ(simple_name("a.b.Type"), "Type");
    EXPECT_EQ(simple_name("ns::inner::Type"), "Type");
    EXPECT_EQ(simple_name("Type"), "Type");
}

TEST_F(RegistryTest, UnknownTypeNameOnWire) {
    Pickler<models::Person> writer(config_);
    Pickler<models::Link> reader(config_);
    auto bytes = writer.encode(models::Person{"Eve", 1});
    EXPECT_THROW(reader.decode(bytes), DecodeError);
}

TEST_F(RegistryTest, ReaderResolvesDifferentOrdinalByName) {
    // LeafNode is ordinal 1 in the tree table but the only type here
    Pickler<models::Tree> tree(config_);
    Pickler<models::LeafNode> leaf(config_);

    auto bytes = tree.encode(models::Tree{models::LeafNode{42}});
    EXPECT_EQ(leaf.decode(bytes), models::LeafNode{42});
}

TEST_F(RegistryTest, UnknownOrdinalOnWire) {
    // RECORD, varint(99 + 1)
    const std::vector<uint8_t> bytes = {41, 200, 1};
    Pickler<models::Person> pickler(config_);
    EXPECT_THROW(pickler.decode(bytes), DecodeError);
}
