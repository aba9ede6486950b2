#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pickler::detail {

template <typename T> struct is_vector : std::false_type {};
template <typename E, typename A> struct is_vector<std::vector<E, A>> : std::true_type {};

template <typename T> struct is_std_array : std::false_type {};
template <typename E, std::size_t N> struct is_std_array<std::array<E, N>> : std::true_type {
    static constexpr std::size_t size = N;
};

// Ordered sequences that map to LIST rather than ARRAY
template <typename T> struct is_list_like : std::false_type {};
template <typename E, typename A> struct is_list_like<std::list<E, A>> : std::true_type {};
template <typename E, typename A> struct is_list_like<std::deque<E, A>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename E> struct is_optional<std::optional<E>> : std::true_type {};

template <typename T> struct is_map_like : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map_like<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map_like<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T> struct is_variant : std::false_type {};
template <typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template <typename T> struct is_shared_ptr : std::false_type {};
template <typename U> struct is_shared_ptr<std::shared_ptr<U>> : std::true_type {};

template <typename T> inline constexpr bool is_vector_v = is_vector<T>::value;
template <typename T> inline constexpr bool is_std_array_v = is_std_array<T>::value;
template <typename T> inline constexpr bool is_list_like_v = is_list_like<T>::value;
template <typename T> inline constexpr bool is_optional_v = is_optional<T>::value;
template <typename T> inline constexpr bool is_map_like_v = is_map_like<T>::value;
template <typename T> inline constexpr bool is_variant_v = is_variant<T>::value;
template <typename T> inline constexpr bool is_shared_ptr_v = is_shared_ptr<T>::value;

template <typename T>
inline constexpr bool is_array_like_v = is_vector_v<T> || is_std_array_v<T>;

// Element type of a shared_ptr with const stripped
template <typename T>
using pointee_t = std::remove_const_t<typename T::element_type>;

// Argument types of a non-generic callable
template <typename F> struct callable_traits : callable_traits<decltype(&F::operator())> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const> {
    using result_type = R;
    using args = std::tuple<std::remove_cvref_t<Args>...>;
    static constexpr std::size_t arity = sizeof...(Args);
};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...)> : callable_traits<R (C::*)(Args...) const> {};

template <typename R, typename... Args>
struct callable_traits<R (*)(Args...)> {
    using result_type = R;
    using args = std::tuple<std::remove_cvref_t<Args>...>;
    static constexpr std::size_t arity = sizeof...(Args);
};

} // namespace pickler::detail
