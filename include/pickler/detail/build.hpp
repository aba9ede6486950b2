#pragma once

#include "../codec.hpp"
#include "../descriptor.hpp"
#include "../errors.hpp"
#include "../registry.hpp"
#include "../type_expr.hpp"
#include "traits.hpp"

#include <fmt/format.h>

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace pickler::detail {

// Types found while walking a root; builders run once ordinals are known
struct Discovery {
    TypeTable& table;
    std::vector<std::function<void(TypeTable&)>> builders;
};

template <typename T>
void discover(Discovery& d, std::string_view context);

template <typename S>
void build_record(TypeTable& table);

template <typename E>
void build_enum(TypeTable& table);

template <typename S, std::size_t... I>
void discover_fields(Discovery& d, std::index_sequence<I...>) {
    (discover<field_value_t<S, I>>(d, Shape<S>::name), ...);
}

template <typename A>
void discover_alternative(Discovery& d, std::string_view context) {
    if constexpr (user_type<A> || is_variant_v<A>) {
        discover<A>(d, context);
    } else {
        throw ConfigurationError(fmt::format(
            "Closed variant {} has member {}; members must be structured, enum or variant types",
            context, type_name_of<A>()));
    }
}

template <typename V, std::size_t... I>
void discover_alternatives(Discovery& d, std::index_sequence<I...>) {
    const std::string context = type_name_of<V>();
    (discover_alternative<std::variant_alternative_t<I, V>>(d, context), ...);
}

template <typename T>
void discover(Discovery& d, std::string_view context) {
    if constexpr (described_record<T>) {
        if (!d.table.add_type(std::string(Shape<T>::name), typeid(T), TypeCategory::Record)) {
            return;
        }
        d.builders.push_back([](TypeTable& table) { build_record<T>(table); });
        discover_fields<T>(d, std::make_index_sequence<field_count_v<T>>{});
    } else if constexpr (described_enum<T>) {
        if (d.table.add_type(std::string(Shape<T>::name), typeid(T), TypeCategory::Enum)) {
            d.builders.push_back([](TypeTable& table) { build_enum<T>(table); });
        }
    } else if constexpr (is_variant_v<T>) {
        discover_alternatives<T>(d, std::make_index_sequence<std::variant_size_v<T>>{});
    } else if constexpr (is_array_like_v<T> || is_list_like_v<T> || is_optional_v<T>) {
        discover<typename T::value_type>(d, context);
    } else if constexpr (is_map_like_v<T>) {
        discover<typename T::key_type>(d, context);
        discover<typename T::mapped_type>(d, context);
    } else if constexpr (is_shared_ptr_v<T>) {
        using U = pointee_t<T>;
        if constexpr (user_type<U> || is_variant_v<U>) {
            discover<U>(d, context);
        } else {
            unsupported<T>(context);
        }
    } else if constexpr (!is_scalar_kind_v<T>) {
        unsupported<T>(context);
    }
}

// Records

template <typename S, std::size_t I, typename Fields>
FieldEntry make_field(const TypeTable& table, const Fields& fields) {
    using F = field_value_t<S, I>;
    const auto& field = std::get<I>(fields);

    TypeExpr type = analyze<F, S>(Shape<S>::name);
    Codec<F> codec = make_codec<F, S>(table);

    FieldEntry entry{std::string(field.name), std::move(type), {}, {}, {}};
    entry.write = [codec, field](WriteBuffer& b, const void* owner) {
        codec.write(b, field.get(*static_cast<const S*>(owner)));
    };
    entry.read = [codec](ReadBuffer& b) -> std::any {
        return codec.read(b);
    };
    entry.max_size = [codec, field](const void* owner) {
        return codec.max_size(field.get(*static_cast<const S*>(owner)));
    };
    return entry;
}

template <typename S, std::size_t... I>
S construct_record(std::vector<std::any>& values, std::index_sequence<I...>) {
    return S{std::any_cast<field_value_t<S, I>>(std::move(values[I]))...};
}

// Whether a fallback's parameters are exactly the first fields of S
template <typename S, typename Args, typename Seq>
struct fallback_matches;

template <typename S, typename Args, std::size_t... I>
struct fallback_matches<S, Args, std::index_sequence<I...>>
    : std::bool_constant<(std::is_same_v<std::tuple_element_t<I, Args>, field_value_t<S, I>> && ...)> {};

template <typename S, typename F, typename Args, std::size_t... I>
S invoke_fallback(const F& factory, std::vector<std::any>& values, std::index_sequence<I...>) {
    return factory(std::any_cast<std::tuple_element_t<I, Args>>(std::move(values[I]))...);
}

template <typename S, typename F>
void add_fallback(TypeEntry& entry, const Fallback<F>& fb) {
    using Traits = typename Fallback<F>::traits;
    using Args = typename Traits::args;
    constexpr std::size_t arity = Fallback<F>::arity;

    if constexpr (arity >= field_count_v<S>) {
        throw ConfigurationError(fmt::format(
            "{}: fallback of arity {} must take fewer than the {} declared fields",
            Shape<S>::name, arity, field_count_v<S>));
    } else if constexpr (!std::is_same_v<std::remove_cvref_t<typename Traits::result_type>, S>) {
        throw ConfigurationError(fmt::format(
            "{}: fallback of arity {} must return {}", Shape<S>::name, arity, Shape<S>::name));
    } else if constexpr (!fallback_matches<S, Args, std::make_index_sequence<arity>>::value) {
        throw ConfigurationError(fmt::format(
            "{}: fallback of arity {} does not take the types of the first {} fields",
            Shape<S>::name, arity, arity));
    } else {
        if (entry.fallbacks.count(arity) != 0) {
            throw ConfigurationError(fmt::format(
                "{}: more than one fallback of arity {}", Shape<S>::name, arity));
        }
        entry.fallbacks.emplace(arity, [factory = fb.factory](std::vector<std::any>&& values) -> std::any {
            return invoke_fallback<S, F, Args>(factory, values, std::make_index_sequence<arity>{});
        });
    }
}

template <typename S>
void build_record(TypeTable& table) {
    TypeEntry& entry = table.entry_at(table.ordinal_of(typeid(S)));
    const auto fields = Shape<S>::fields();

    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (entry.fields.push_back(make_field<S, I>(table, fields)), ...);
    }(std::make_index_sequence<field_count_v<S>>{});

    entry.construct = [](std::vector<std::any>&& values) -> std::any {
        return construct_record<S>(values, std::make_index_sequence<field_count_v<S>>{});
    };

    if constexpr (has_fallbacks<S>) {
        std::apply([&entry](const auto&... fb) { (add_fallback<S>(entry, fb), ...); },
                   Shape<S>::fallbacks());
    }
}

// Enums

template <typename E>
void build_enum(TypeTable& table) {
    TypeEntry& entry = table.entry_at(table.ordinal_of(typeid(E)));
    const auto constants = Shape<E>::constants();
    for (const auto& c : constants) {
        entry.constants.emplace_back(c.name);
    }
    entry.constant_at = [](uint32_t index) -> std::any {
        return Shape<E>::constants()[index].value;
    };
}

// Discover every type reachable from T, assign ordinals and build the chains
template <typename T>
std::shared_ptr<const TypeTable> build_table(const Config& config) {
    auto table = std::make_shared<TypeTable>(type_name_of<T>(), config);

    Discovery d{*table, {}};
    discover<T>(d, table->root_name());
    table->assign_ordinals();
    for (const auto& build : d.builders) {
        build(*table);
    }
    table->finish();
    return table;
}

} // namespace pickler::detail
