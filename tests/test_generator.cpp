#include <gtest/gtest.h>

#include "generator.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using pickler::gen::Generator;
using pickler::gen::TypeInfo;

class GeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("pickler_gen_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".hpp");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& source) {
        std::ofstream out(path_);
        out << source;
    }

    std::filesystem::path path_;
};

TEST_F(GeneratorTest, FindsAnnotatedTypes) {
    write(R"(
namespace shop {

enum class [[pickler::enumeration]] Status { Open, Closed };

struct [[pickler::record]] Order {
    long id;
    int quantity;
    Status status;
};

struct Plain {
    int x;
};

} // namespace shop
)");

    Generator gen;
    ASSERT_TRUE(gen.parse(path_.string(), {}));
    ASSERT_EQ(gen.types().size(), 2u);

    const TypeInfo* order = nullptr;
    const TypeInfo* status = nullptr;
    for (const auto& t : gen.types()) {
        if (t.name == "Order") order = &t;
        if (t.name == "Status") status = &t;
    }
    ASSERT_NE(order, nullptr);
    ASSERT_NE(status, nullptr);

    EXPECT_EQ(order->kind, TypeInfo::Kind::Record);
    EXPECT_EQ(order->qualified_name, "::shop::Order");
    EXPECT_EQ(order->wire_name, "shop.Order");
    ASSERT_EQ(order->fields.size(), 3u);
    EXPECT_EQ(order->fields[1].name, "quantity");

    EXPECT_EQ(status->kind, TypeInfo::Kind::Enumeration);
    ASSERT_EQ(status->constants.size(), 2u);
    EXPECT_EQ(status->constants[0].name, "Open");
}

TEST_F(GeneratorTest, NameOverrides) {
    write(R"(
namespace app {

/// @name("legacy.Point")
struct [[pickler::record]] Point {
    /// @name("x_coord")
    double x;
    double y;
};

} // namespace app
)");

    Generator gen;
    ASSERT_TRUE(gen.parse(path_.string(), {}));
    ASSERT_EQ(gen.types().size(), 1u);
    const auto& point = gen.types()[0];
    EXPECT_EQ(point.wire_name, "legacy.Point");
    EXPECT_EQ(point.fields[0].wire_name, "x_coord");
    EXPECT_EQ(point.fields[1].wire_name, "y");
}

TEST_F(GeneratorTest, GeneratedHeader) {
    write(R"(
namespace geo {
enum class [[pickler::enumeration]] Axis { X, Y };
struct [[pickler::record]] Vec {
    float x;
    float y;
};
} // namespace geo
)");

    Generator gen;
    ASSERT_TRUE(gen.parse(path_.string(), {}));
    std::string header = gen.generate_header();

    EXPECT_NE(header.find("// Generated by pickler-gen - DO NOT EDIT"), std::string::npos);
    EXPECT_NE(header.find("struct Shape<::geo::Vec>"), std::string::npos);
    EXPECT_NE(header.find("static constexpr std::string_view name = \"geo.Vec\";"), std::string::npos);
    EXPECT_NE(header.find("pickler::field(\"x\", &::geo::Vec::x)"), std::string::npos);
    EXPECT_NE(header.find("pickler::constant(\"Y\", ::geo::Axis::Y)"), std::string::npos);
}

TEST_F(GeneratorTest, MissingFileFails) {
    Generator gen;
    EXPECT_FALSE(gen.parse("/nonexistent/pickler_gen_missing.hpp", {}));
}
