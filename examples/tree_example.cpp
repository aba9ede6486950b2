// Example recursive structure - a binary expression tree
// Demonstrates hand-written Shapes, boxed variant children and schema evolution
#include <pickler/inspect.hpp>
#include <pickler/pickler.hpp>

#include <fmt/format.h>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

namespace expr {

struct Number;
struct Binary;
using Node = std::variant<Number, Binary>;

struct Number {
    double value;
};

struct Binary {
    char op;
    std::shared_ptr<const Node> left;
    std::shared_ptr<const Node> right;
};

// Same wire name as Number with an added field; old data gets a default unit
struct Quantity {
    double value;
    std::string unit;
};

std::shared_ptr<const Node> num(double v) {
    return std::make_shared<const Node>(Number{v});
}

std::shared_ptr<const Node> bin(char op, std::shared_ptr<const Node> l, std::shared_ptr<const Node> r) {
    return std::make_shared<const Node>(Binary{op, std::move(l), std::move(r)});
}

double evaluate(const Node& node) {
    if (const auto* n = std::get_if<Number>(&node)) {
        return n->value;
    }
    const auto& b = std::get<Binary>(node);
    double l = evaluate(*b.left);
    double r = evaluate(*b.right);
    switch (b.op) {
        case '+': return l + r;
        case '-': return l - r;
        case '*': return l * r;
        default: return l / r;
    }
}

std::string render(const Node& node) {
    if (const auto* n = std::get_if<Number>(&node)) {
        return fmt::format("{}", n->value);
    }
    const auto& b = std::get<Binary>(node);
    return fmt::format("({} {} {})", render(*b.left), b.op, render(*b.right));
}

} // namespace expr

template <>
struct pickler::Shape<expr::Number> {
    static constexpr std::string_view name = "expr.Number";
    static auto fields() {
        return pickler::fields(pickler::field("value", &expr::Number::value));
    }
};

template <>
struct pickler::Shape<expr::Binary> {
    static constexpr std::string_view name = "expr.Binary";
    static auto fields() {
        return pickler::fields(pickler::field("op", &expr::Binary::op),
                               pickler::field("left", &expr::Binary::left),
                               pickler::field("right", &expr::Binary::right));
    }
};

template <>
struct pickler::Shape<expr::Quantity> {
    static constexpr std::string_view name = "expr.Number";
    static auto fields() {
        return pickler::fields(pickler::field("value", &expr::Quantity::value),
                               pickler::field("unit", &expr::Quantity::unit));
    }
    static auto fallbacks() {
        return pickler::fallbacks(pickler::fallback([](double value) {
            return expr::Quantity{value, "m"};
        }));
    }
};

int main() {
    try {
        pickler::Pickler<expr::Node> pickler;

        // (1.5 + 2) * (10 - 4 / 2)
        auto tree = expr::bin('*',
                              expr::bin('+', expr::num(1.5), expr::num(2)),
                              expr::bin('-', expr::num(10), expr::bin('/', expr::num(4), expr::num(2))));

        auto bytes = pickler.encode(*tree);
        expr::Node decoded = pickler.decode(bytes);

        std::cout << fmt::format("Expression: {}\n", expr::render(decoded));
        std::cout << fmt::format("Value:      {}\n", expr::evaluate(decoded));
        std::cout << fmt::format("Encoded:    {} bytes (bound {})\n\n",
                                 bytes.size(), pickler.max_encoded_size(*tree));

        for (uint32_t i = 0; i < pickler.table().size(); ++i) {
            std::cout << fmt::format("  ordinal {} -> {} signature {:016x}\n",
                                     i, pickler.type_at(i), pickler.table().signature(i));
        }

        std::cout << "\nWire layout:\n" << pickler::inspect(bytes) << "\n";

        // A newer reader of the leaf type fills the missing unit
        pickler::Pickler<expr::Number> old_writer(pickler::Config{});
        pickler::Pickler<expr::Quantity> new_reader(
            pickler::Config{pickler::Compatibility::Backwards, pickler::DEFAULT_MAX_DEPTH});
        expr::Quantity q = new_reader.decode(old_writer.encode(expr::Number{42}));
        std::cout << fmt::format("Evolved leaf: {} {}\n", q.value, q.unit);
    } catch (const pickler::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
