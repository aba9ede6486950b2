#pragma once

#include <pickler/descriptor.hpp>
#include <pickler/types.hpp>

#include <array>
#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace models {

struct Person {
    std::string name;
    int32_t age = 0;

    bool operator==(const Person&) const = default;
};

enum class Color { Red, Green, Blue };

// Same wire name as Color, constants in a different order
enum class ReorderedColor { Blue, Green, Red };

struct Paint {
    Color color = Color::Red;
    std::vector<Color> palette;
    std::optional<Color> accent;

    bool operator==(const Paint&) const = default;
};

// Every scalar kind
struct Scalars {
    bool flag = false;
    int8_t tiny = 0;
    uint8_t octet = 0;
    int16_t small = 0;
    char16_t letter = 0;
    char ch = 0;
    int32_t count = 0;
    uint32_t mask = 0;
    int64_t big = 0;
    uint64_t huge = 0;
    float ratio = 0;
    double precise = 0;
    std::string text;
    pickler::Uuid id;

    bool operator==(const Scalars&) const = default;
};

// Containers of every kind, nested
struct Containers {
    std::vector<std::list<std::optional<std::vector<int32_t>>>> deep;
    std::map<std::string, std::vector<Person>> groups;
    std::unordered_map<int32_t, std::string> names;
    std::deque<double> samples;
    std::array<int16_t, 3> triple{};
    std::vector<bool> bits;
    std::vector<uint8_t> blob;
    std::vector<std::string> words;
    std::vector<pickler::Uuid> ids;
    std::vector<int64_t> longs;
    std::vector<uint32_t> unsigned_ints;
    std::vector<float> floats;
    std::vector<char> chars;
    std::optional<Person> owner;

    bool operator==(const Containers&) const = default;
};

struct Numbers {
    std::vector<int32_t> values;

    bool operator==(const Numbers&) const = default;
};

// Binary tree as a closed variant
struct LeafNode {
    int32_t value = 0;

    bool operator==(const LeafNode&) const = default;
};

struct InternalNode;
using Tree = std::variant<InternalNode, LeafNode>;

struct InternalNode {
    std::string name;
    std::shared_ptr<const Tree> left;
    std::shared_ptr<const Tree> right;
};

bool operator==(const InternalNode& a, const InternalNode& b);

inline bool same_subtree(const std::shared_ptr<const Tree>& a, const std::shared_ptr<const Tree>& b) {
    if (!a || !b) {
        return !a && !b;
    }
    return *a == *b;
}

inline bool operator==(const InternalNode& a, const InternalNode& b) {
    return a.name == b.name && same_subtree(a.left, b.left) && same_subtree(a.right, b.right);
}

inline std::shared_ptr<const Tree> leaf(int32_t value) {
    return std::make_shared<const Tree>(LeafNode{value});
}

inline std::shared_ptr<const Tree> node(std::string name, std::shared_ptr<const Tree> left,
                                        std::shared_ptr<const Tree> right) {
    return std::make_shared<const Tree>(InternalNode{std::move(name), std::move(left), std::move(right)});
}

// Stack protocol
struct Push {
    std::string item;

    bool operator==(const Push&) const = default;
};

struct Pop {
    bool operator==(const Pop&) const = default;
};

struct Peek {
    bool operator==(const Peek&) const = default;
};

using StackCommand = std::variant<Push, Pop, Peek>;

struct Success {
    std::optional<std::string> value;

    bool operator==(const Success&) const = default;
};

struct Failure {
    std::string reason;

    bool operator==(const Failure&) const = default;
};

using StackResponse = std::variant<Success, Failure>;

// Shapes nested one variant inside another
using Message = std::variant<StackCommand, StackResponse, Color>;

// Linked list through same-type references
struct Link {
    int32_t value = 0;
    std::shared_ptr<const Link> next;
};

inline bool operator==(const Link& a, const Link& b) {
    if (a.value != b.value) return false;
    if (!a.next || !b.next) return !a.next && !b.next;
    return *a.next == *b.next;
}

inline Link make_chain(int32_t length) {
    Link head{length - 1, nullptr};
    for (int32_t v = length - 2; v >= 0; --v) {
        head = Link{v, std::make_shared<const Link>(std::move(head))};
    }
    return head;
}

struct Family {
    Person parent;
    std::vector<Family> children;

    bool operator==(const Family&) const = default;
};

// Unsupported field types
struct WithPointer {
    const Person* person = nullptr;
};

struct WithSet {
    std::set<int32_t> values;
};

struct WithBoxedInt {
    std::shared_ptr<const int32_t> value;
};

struct WithPrimitiveVariant {
    std::variant<Person, int32_t> value;
};

struct Undescribed {
    int32_t x = 0;
};

struct WithUndescribed {
    Undescribed inner;
};

// Two types under one wire name
struct DuplicateA {
    int32_t x = 0;
};

struct DuplicateB {
    std::string y;
};

struct WithDuplicates {
    DuplicateA a;
    DuplicateB b;
};

struct BadFallback {
    int32_t a = 0;
    std::string b;
};

} // namespace models

// Versions of one record, all registered as "evolution.Record"
namespace evolution {

namespace v1 {
struct Record {
    int32_t a = 0;
};
} // namespace v1

namespace v3 {
struct Record {
    int32_t a = 0;
    std::string b;
    double c = 0;
};
} // namespace v3

namespace v4 {
struct Record {
    int32_t a = 0;
    std::string b;
    double c = 0;
    int64_t d = 0;
};
} // namespace v4

namespace v5 {
struct Record {
    int32_t a = 0;
    std::string b;
    double c = 0;
    std::vector<std::string> d;
    std::optional<models::Person> e;
};
} // namespace v5

namespace v1 {
struct Palette {
    models::Color color = models::Color::Red;
};
} // namespace v1

namespace v2 {
enum class Finish { Matte, Gloss };

struct Palette {
    models::Color color = models::Color::Red;
    Finish finish = Finish::Matte;
};
} // namespace v2

} // namespace evolution

template <>
struct pickler::Shape<models::Person> {
    static constexpr std::string_view name = "models.Person";
    static auto fields() {
        return pickler::fields(pickler::field("name", &models::Person::name),
                               pickler::field("age", &models::Person::age));
    }
};

template <>
struct pickler::Shape<models::Color> {
    static constexpr std::string_view name = "models.Color";
    static constexpr auto constants() {
        return pickler::constants(pickler::constant("RED", models::Color::Red),
                                  pickler::constant("GREEN", models::Color::Green),
                                  pickler::constant("BLUE", models::Color::Blue));
    }
};

template <>
struct pickler::Shape<models::ReorderedColor> {
    static constexpr std::string_view name = "models.Color";
    static constexpr auto constants() {
        return pickler::constants(pickler::constant("BLUE", models::ReorderedColor::Blue),
                                  pickler::constant("GREEN", models::ReorderedColor::Green),
                                  pickler::constant("RED", models::ReorderedColor::Red));
    }
};

template <>
struct pickler::Shape<models::Paint> {
    static constexpr std::string_view name = "models.Paint";
    static auto fields() {
        return pickler::fields(pickler::field("color", &models::Paint::color),
                               pickler::field("palette", &models::Paint::palette),
                               pickler::field("accent", &models::Paint::accent));
    }
};

template <>
struct pickler::Shape<models::Scalars> {
    static constexpr std::string_view name = "models.Scalars";
    static auto fields() {
        using S = models::Scalars;
        return pickler::fields(pickler::field("flag", &S::flag),
                               pickler::field("tiny", &S::tiny),
                               pickler::field("octet", &S::octet),
                               pickler::field("small", &S::small),
                               pickler::field("letter", &S::letter),
                               pickler::field("ch", &S::ch),
                               pickler::field("count", &S::count),
                               pickler::field("mask", &S::mask),
                               pickler::field("big", &S::big),
                               pickler::field("huge", &S::huge),
                               pickler::field("ratio", &S::ratio),
                               pickler::field("precise", &S::precise),
                               pickler::field("text", &S::text),
                               pickler::field("id", &S::id));
    }
};

template <>
struct pickler::Shape<models::Containers> {
    static constexpr std::string_view name = "models.Containers";
    static auto fields() {
        using C = models::Containers;
        return pickler::fields(pickler::field("deep", &C::deep),
                               pickler::field("groups", &C::groups),
                               pickler::field("names", &C::names),
                               pickler::field("samples", &C::samples),
                               pickler::field("triple", &C::triple),
                               pickler::field("bits", &C::bits),
                               pickler::field("blob", &C::blob),
                               pickler::field("words", &C::words),
                               pickler::field("ids", &C::ids),
                               pickler::field("longs", &C::longs),
                               pickler::field("unsigned_ints", &C::unsigned_ints),
                               pickler::field("floats", &C::floats),
                               pickler::field("chars", &C::chars),
                               pickler::field("owner", &C::owner));
    }
};

template <>
struct pickler::Shape<models::Numbers> {
    static constexpr std::string_view name = "models.Numbers";
    static auto fields() {
        return pickler::fields(pickler::field("values", &models::Numbers::values));
    }
};

template <>
struct pickler::Shape<models::LeafNode> {
    static constexpr std::string_view name = "models.LeafNode";
    static auto fields() {
        return pickler::fields(pickler::field("value", &models::LeafNode::value));
    }
};

template <>
struct pickler::Shape<models::InternalNode> {
    static constexpr std::string_view name = "models.InternalNode";
    static auto fields() {
        return pickler::fields(pickler::field("name", &models::InternalNode::name),
                               pickler::field("left", &models::InternalNode::left),
                               pickler::field("right", &models::InternalNode::right));
    }
};

template <>
struct pickler::Shape<models::Push> {
    static constexpr std::string_view name = "models.Push";
    static auto fields() {
        return pickler::fields(pickler::field("item", &models::Push::item));
    }
};

template <>
struct pickler::Shape<models::Pop> {
    static constexpr std::string_view name = "models.Pop";
    static auto fields() { return pickler::fields(); }
};

template <>
struct pickler::Shape<models::Peek> {
    static constexpr std::string_view name = "models.Peek";
    static auto fields() { return pickler::fields(); }
};

template <>
struct pickler::Shape<models::Success> {
    static constexpr std::string_view name = "models.Success";
    static auto fields() {
        return pickler::fields(pickler::field("value", &models::Success::value));
    }
};

template <>
struct pickler::Shape<models::Failure> {
    static constexpr std::string_view name = "models.Failure";
    static auto fields() {
        return pickler::fields(pickler::field("reason", &models::Failure::reason));
    }
};

template <>
struct pickler::Shape<models::Link> {
    static constexpr std::string_view name = "models.Link";
    static auto fields() {
        return pickler::fields(pickler::field("value", &models::Link::value),
                               pickler::field("next", &models::Link::next));
    }
};

template <>
struct pickler::Shape<models::Family> {
    static constexpr std::string_view name = "models.Family";
    static auto fields() {
        return pickler::fields(pickler::field("parent", &models::Family::parent),
                               pickler::field("children", &models::Family::children));
    }
};

template <>
struct pickler::Shape<models::WithPointer> {
    static constexpr std::string_view name = "models.WithPointer";
    static auto fields() {
        return pickler::fields(pickler::field("person", &models::WithPointer::person));
    }
};

template <>
struct pickler::Shape<models::WithSet> {
    static constexpr std::string_view name = "models.WithSet";
    static auto fields() {
        return pickler::fields(pickler::field("values", &models::WithSet::values));
    }
};

template <>
struct pickler::Shape<models::WithBoxedInt> {
    static constexpr std::string_view name = "models.WithBoxedInt";
    static auto fields() {
        return pickler::fields(pickler::field("value", &models::WithBoxedInt::value));
    }
};

template <>
struct pickler::Shape<models::WithPrimitiveVariant> {
    static constexpr std::string_view name = "models.WithPrimitiveVariant";
    static auto fields() {
        return pickler::fields(pickler::field("value", &models::WithPrimitiveVariant::value));
    }
};

template <>
struct pickler::Shape<models::WithUndescribed> {
    static constexpr std::string_view name = "models.WithUndescribed";
    static auto fields() {
        return pickler::fields(pickler::field("inner", &models::WithUndescribed::inner));
    }
};

template <>
struct pickler::Shape<models::DuplicateA> {
    static constexpr std::string_view name = "models.Duplicate";
    static auto fields() {
        return pickler::fields(pickler::field("x", &models::DuplicateA::x));
    }
};

template <>
struct pickler::Shape<models::DuplicateB> {
    static constexpr std::string_view name = "models.Duplicate";
    static auto fields() {
        return pickler::fields(pickler::field("y", &models::DuplicateB::y));
    }
};

template <>
struct pickler::Shape<models::WithDuplicates> {
    static constexpr std::string_view name = "models.WithDuplicates";
    static auto fields() {
        return pickler::fields(pickler::field("a", &models::WithDuplicates::a),
                               pickler::field("b", &models::WithDuplicates::b));
    }
};

template <>
struct pickler::Shape<models::BadFallback> {
    static constexpr std::string_view name = "models.BadFallback";
    static auto fields() {
        return pickler::fields(pickler::field("a", &models::BadFallback::a),
                               pickler::field("b", &models::BadFallback::b));
    }
    // First field is an int32, not a string
    static auto fallbacks() {
        return pickler::fallbacks(pickler::fallback([](std::string b) {
            return models::BadFallback{0, std::move(b)};
        }));
    }
};

template <>
struct pickler::Shape<evolution::v1::Record> {
    static constexpr std::string_view name = "evolution.Record";
    static auto fields() {
        return pickler::fields(pickler::field("a", &evolution::v1::Record::a));
    }
};

template <>
struct pickler::Shape<evolution::v1::Palette> {
    static constexpr std::string_view name = "evolution.Palette";
    static auto fields() {
        return pickler::fields(pickler::field("color", &evolution::v1::Palette::color));
    }
};

template <>
struct pickler::Shape<evolution::v2::Finish> {
    static constexpr std::string_view name = "evolution.Finish";
    static constexpr auto constants() {
        return pickler::constants(pickler::constant("MATTE", evolution::v2::Finish::Matte),
                                  pickler::constant("GLOSS", evolution::v2::Finish::Gloss));
    }
};

template <>
struct pickler::Shape<evolution::v2::Palette> {
    static constexpr std::string_view name = "evolution.Palette";
    static auto fields() {
        using P = evolution::v2::Palette;
        return pickler::fields(pickler::field("color", &P::color),
                               pickler::field("finish", &P::finish));
    }
};

template <>
struct pickler::Shape<evolution::v3::Record> {
    static constexpr std::string_view name = "evolution.Record";
    static auto fields() {
        using R = evolution::v3::Record;
        return pickler::fields(pickler::field("a", &R::a),
                               pickler::field("b", &R::b),
                               pickler::field("c", &R::c));
    }
    static auto fallbacks() {
        return pickler::fallbacks(pickler::fallback([](int32_t a) {
            return evolution::v3::Record{a, "default", 2.5};
        }));
    }
};

template <>
struct pickler::Shape<evolution::v4::Record> {
    static constexpr std::string_view name = "evolution.Record";
    static auto fields() {
        using R = evolution::v4::Record;
        return pickler::fields(pickler::field("a", &R::a),
                               pickler::field("b", &R::b),
                               pickler::field("c", &R::c),
                               pickler::field("d", &R::d));
    }
};

template <>
struct pickler::Shape<evolution::v5::Record> {
    static constexpr std::string_view name = "evolution.Record";
    static auto fields() {
        using R = evolution::v5::Record;
        return pickler::fields(pickler::field("a", &R::a),
                               pickler::field("b", &R::b),
                               pickler::field("c", &R::c),
                               pickler::field("d", &R::d),
                               pickler::field("e", &R::e));
    }
};
