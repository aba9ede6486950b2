#pragma once

#include "descriptor.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "detail/traits.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace pickler {

// Immutable tree describing the container and value structure of one
// declared field, e.g. LIST(OPTIONAL(string)) or MAP(string, app.Person).
class TypeExpr {
public:
    enum class Kind : uint8_t {
        Array,
        List,
        Optional,
        Map,
        Value
    };

    static TypeExpr array(TypeExpr element);
    static TypeExpr list(TypeExpr element);
    static TypeExpr optional(TypeExpr element);
    static TypeExpr map(TypeExpr key, TypeExpr value);
    static TypeExpr value(ValueKind kind, std::string type_name,
                          bool boxed = false, bool same_type = false);

    Kind kind() const { return kind_; }
    bool is_container() const { return kind_ != Kind::Value; }

    // Value nodes only
    ValueKind value_kind() const { return value_kind_; }
    const std::string& type_name() const { return type_name_; }
    bool boxed() const { return boxed_; }
    bool same_type() const { return same_type_; }

    // Array, List, Optional: element. Map: key() and value().
    const TypeExpr& element() const;
    const TypeExpr& key() const;
    const TypeExpr& mapped() const;

    std::string to_tree_string() const;

    bool operator==(const TypeExpr& other) const = default;

private:
    TypeExpr(Kind kind, std::vector<TypeExpr> children);

    Kind kind_ = Kind::Value;
    ValueKind value_kind_ = ValueKind::Structured;
    std::string type_name_;
    bool boxed_ = false;
    bool same_type_ = false;
    std::vector<TypeExpr> children_;
};

// Map a leaf C++ type to its ValueKind. Unsigned integers share the kind of
// their signed counterpart.
template <typename T>
constexpr std::optional<ValueKind> value_kind_of() {
    if constexpr (std::is_same_v<T, bool>) return ValueKind::Bool;
    else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, uint8_t>) return ValueKind::Byte;
    else if constexpr (std::is_same_v<T, int16_t> || std::is_same_v<T, uint16_t>) return ValueKind::Short;
    else if constexpr (std::is_same_v<T, char> || std::is_same_v<T, char16_t>) return ValueKind::Char;
    else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, uint32_t>) return ValueKind::Int32;
    else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) return ValueKind::Int64;
    else if constexpr (std::is_same_v<T, float>) return ValueKind::Float32;
    else if constexpr (std::is_same_v<T, double>) return ValueKind::Float64;
    else if constexpr (std::is_same_v<T, std::string>) return ValueKind::String;
    else if constexpr (std::is_same_v<T, Uuid>) return ValueKind::Uuid;
    else if constexpr (described_enum<T>) return ValueKind::Enum;
    else if constexpr (described_record<T>) return ValueKind::Structured;
    else if constexpr (detail::is_variant_v<T>) return ValueKind::ClosedVariant;
    else return std::nullopt;
}

template <typename T>
inline constexpr bool is_scalar_kind_v =
    value_kind_of<T>().has_value() && !user_type<T> && !detail::is_variant_v<T>;

namespace detail {

template <typename T>
[[noreturn]] void unsupported(std::string_view context) {
    throw ConfigurationError(fmt::format(
        "Unsupported type {} in {}", typeid(T).name(), context));
}

template <typename V, std::size_t... I>
std::string variant_name(std::index_sequence<I...>);

} // namespace detail

// Name written in TypeExpr value nodes
template <typename T>
std::string type_name_of() {
    if constexpr (user_type<T>) {
        return std::string(Shape<T>::name);
    } else if constexpr (detail::is_variant_v<T>) {
        return detail::variant_name<T>(std::make_index_sequence<std::variant_size_v<T>>{});
    } else if constexpr (value_kind_of<T>().has_value()) {
        return std::string(value_kind_name(*value_kind_of<T>()));
    } else {
        return typeid(T).name();
    }
}

template <typename V, std::size_t... I>
std::string detail::variant_name(std::index_sequence<I...>) {
    std::string name = "variant<";
    ((name += (I == 0 ? "" : "|"), name += type_name_of<std::variant_alternative_t<I, V>>()), ...);
    name += ">";
    return name;
}

// Classify a declared field type. `Enclosing` is the structured type that
// declares the field and is used to tag same-type references.
template <typename F, typename Enclosing>
TypeExpr analyze(std::string_view context) {
    if constexpr (detail::is_array_like_v<F>) {
        return TypeExpr::array(analyze<typename F::value_type, Enclosing>(context));
    } else if constexpr (detail::is_list_like_v<F>) {
        return TypeExpr::list(analyze<typename F::value_type, Enclosing>(context));
    } else if constexpr (detail::is_optional_v<F>) {
        return TypeExpr::optional(analyze<typename F::value_type, Enclosing>(context));
    } else if constexpr (detail::is_map_like_v<F>) {
        return TypeExpr::map(analyze<typename F::key_type, Enclosing>(context),
                             analyze<typename F::mapped_type, Enclosing>(context));
    } else if constexpr (detail::is_shared_ptr_v<F>) {
        using U = detail::pointee_t<F>;
        if constexpr (user_type<U> || detail::is_variant_v<U>) {
            return TypeExpr::value(*value_kind_of<U>(), type_name_of<U>(), true,
                                   std::is_same_v<U, Enclosing>);
        } else {
            detail::unsupported<F>(context);
        }
    } else if constexpr (value_kind_of<F>().has_value()) {
        return TypeExpr::value(*value_kind_of<F>(), type_name_of<F>(), false,
                               std::is_same_v<F, Enclosing>);
    } else {
        detail::unsupported<F>(context);
    }
}

} // namespace pickler
