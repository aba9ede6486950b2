#include <gtest/gtest.h>
#include <pickler/errors.hpp>
#include <pickler/inspect.hpp>
#include <pickler/pickler.hpp>

#include "test_models.hpp"

#include <string>
#include <vector>

using namespace pickler;

class InspectTest : public ::testing::Test {
protected:
    Config config_{};
};

TEST_F(InspectTest, RecordDump) {
    Pickler<models::Person> pickler(config_);
    std::string dump = inspect(pickler.encode(models::Person{"Alice", 30}));

    EXPECT_NE(dump.find("@0 RECORD #0 models.Person (2 fields)"), std::string::npos);
    EXPECT_NE(dump.find("  @"), std::string::npos);
    EXPECT_NE(dump.find("STRING \"Alice\""), std::string::npos);
    EXPECT_NE(dump.find("INT32_VAR 30"), std::string::npos);
}

TEST_F(InspectTest, ResolvesInternedReferences) {
    Pickler<models::Person> pickler(config_);
    std::vector<models::Person> people = {{"A", 1}, {"B", 2}};
    WriteBuffer buffer(pickler.max_encoded_size(std::span<const models::Person>(people)));
    pickler.encode_many(buffer, people);

    std::string dump = inspect(buffer.flip());
    size_t first = dump.find("models.Person");
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(dump.find("models.Person", first + 1), std::string::npos);
}

TEST_F(InspectTest, PackedArrays) {
    Pickler<models::Numbers> pickler(config_);
    std::string dump = inspect(pickler.encode(models::Numbers{{1, 2, 3}}));
    EXPECT_NE(dump.find("ARRAY<INT32_VAR> [3]: 1, 2, 3"), std::string::npos);
}

TEST_F(InspectTest, EnumsAndVariants) {
    Pickler<models::Message> pickler(config_);
    std::string dump = inspect(pickler.encode(models::Message{models::Color::Green}));
    EXPECT_NE(dump.find("ENUM #0"), std::string::npos);
    EXPECT_NE(dump.find("index=1"), std::string::npos);
}

TEST_F(InspectTest, SkipValueLandsAfterValue) {
    Pickler<models::Containers> containers(config_);
    Pickler<models::Tree> trees(config_);

    models::Containers c;
    c.groups = {{"g", {{"P", 1}}}};
    c.deep = {{std::optional<std::vector<int32_t>>{{5}}}};
    c.bits = {true, false, true};
    c.owner = models::Person{"Owner", 2};

    WriteBuffer buffer(4096);
    containers.encode(buffer, c);
    size_t first_end = buffer.position();
    trees.encode(buffer, *models::node("n", models::leaf(1), nullptr));
    size_t second_end = buffer.position();

    ReadBuffer in(buffer.flip());
    skip_value(in);
    EXPECT_EQ(in.position(), first_end);
    skip_value(in);
    EXPECT_EQ(in.position(), second_end);
}

TEST_F(InspectTest, SkipRespectsDepth) {
    Pickler<models::Link> pickler(Config{Compatibility::None, 1000});
    auto bytes = pickler.encode(models::make_chain(50));

    ReadBuffer deep(bytes);
    EXPECT_THROW(skip_value(deep, 10), DepthExceededError);

    ReadBuffer ok(bytes);
    skip_value(ok, 1000);
    EXPECT_FALSE(ok.has_remaining());
}

TEST_F(InspectTest, GarbageIsDecodeError) {
    const std::vector<uint8_t> bytes = {0x7F, 0x00};
    EXPECT_THROW(inspect(bytes), DecodeError);

    ReadBuffer in(bytes);
    EXPECT_THROW(skip_value(in), DecodeError);
}

TEST_F(InspectTest, EmptyInput) {
    EXPECT_TRUE(inspect(std::vector<uint8_t>{}).empty());
}
