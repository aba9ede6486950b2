#pragma once

#include "detail/traits.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <functional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace pickler {

// Describes a user type to the pickler. Specialise for each structured or
// enum type, by hand or with pickler-gen:
//
//   template <> struct pickler::Shape<app::Person> {
//       static constexpr std::string_view name = "app.Person";
//       static auto fields() {
//           return pickler::fields(pickler::field("name", &app::Person::name),
//                                  pickler::field("age", &app::Person::age));
//       }
//   };
//
// Structured types are rebuilt with S{field0, field1, ...} in field order.
// An optional fallbacks() lists factories for older encodings with fewer
// fields (one per arity); enums provide constants() instead of fields().
template <typename T>
struct Shape {};

// One declared field: a name plus a data member or const getter
template <typename S, typename Accessor>
struct Field {
    using owner_type = S;
    using value_type = std::remove_cvref_t<std::invoke_result_t<const Accessor&, const S&>>;

    std::string_view name;
    Accessor accessor;

    decltype(auto) get(const S& owner) const { return std::invoke(accessor, owner); }
};

template <typename S, typename M>
    requires(!std::is_function_v<M>)
constexpr Field<S, M S::*> field(std::string_view name, M S::*member) {
    return {name, member};
}

template <typename S, typename R>
constexpr Field<S, R (S::*)() const> field(std::string_view name, R (S::*getter)() const) {
    return {name, getter};
}

template <typename... Fs>
constexpr std::tuple<Fs...> fields(Fs... fs) {
    return std::tuple<Fs...>{fs...};
}

// Named enum constant. The wire carries the index within constants().
template <typename E>
struct Constant {
    std::string_view name;
    E value;
};

template <typename E>
constexpr Constant<E> constant(std::string_view name, E value) {
    return {name, value};
}

template <typename E, typename... Rest>
constexpr std::array<Constant<E>, 1 + sizeof...(Rest)> constants(Constant<E> first, Rest... rest) {
    return {first, rest...};
}

// Factory for an encoding that carries only the first N fields
template <typename F>
struct Fallback {
    using traits = detail::callable_traits<F>;
    static constexpr std::size_t arity = traits::arity;

    F factory;
};

template <typename F>
constexpr Fallback<F> fallback(F factory) {
    return {std::move(factory)};
}

template <typename... Fs>
constexpr std::tuple<Fs...> fallbacks(Fs... fs) {
    return std::tuple<Fs...>{std::move(fs)...};
}

// Concepts

template <typename T>
concept described_record = std::is_class_v<T> && requires {
    { Shape<T>::name } -> std::convertible_to<std::string_view>;
    Shape<T>::fields();
};

template <typename T>
concept described_enum = std::is_enum_v<T> && requires {
    { Shape<T>::name } -> std::convertible_to<std::string_view>;
    Shape<T>::constants();
};

template <typename T>
concept has_fallbacks = described_record<T> && requires { Shape<T>::fallbacks(); };

// A type that receives an ordinal
template <typename T>
concept user_type = described_record<T> || described_enum<T>;

template <typename T>
using fields_t = decltype(Shape<T>::fields());

template <typename T>
inline constexpr std::size_t field_count_v = std::tuple_size_v<fields_t<T>>;

template <typename T, std::size_t I>
using field_value_t = typename std::tuple_element_t<I, fields_t<T>>::value_type;

} // namespace pickler
