#pragma once

#include "descriptor.hpp"
#include "errors.hpp"
#include "registry.hpp"
#include "type_expr.hpp"
#include "wire.hpp"
#include "detail/traits.hpp"

#include <fmt/format.h>

#include <any>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace pickler {

// Typed (write, read, max_size) triple for one C++ type. Built once per
// declared field when the type table is built; nested codecs are captured
// by value so a chain never looks anything up by name or type at runtime.
template <typename T>
struct Codec {
    std::function<void(WriteBuffer&, const T&)> write;
    std::function<T(ReadBuffer&)> read;
    std::function<size_t(const T&)> max_size;
    // Element marker when T is the element of an array of full-codec values
    Marker marker = Marker::Record;
};

// Build the codec for `T` as declared inside `Enclosing` (void at the root).
// A structured T equal to Enclosing is written as a same-type reference.
template <typename T, typename Enclosing>
Codec<T> make_codec(const TypeTable& table);

namespace detail {

// Index of `value` within Shape<E>::constants()
template <typename E>
uint32_t enum_index(E value) {
    const auto cs = Shape<E>::constants();
    for (uint32_t i = 0; i < cs.size(); ++i) {
        if (cs[i].value == value) {
            return i;
        }
    }
    throw EncodeError(fmt::format("Value {} is not a declared constant of {}",
                                  static_cast<int64_t>(value), Shape<E>::name));
}

template <typename T>
Codec<T> scalar_codec() {
    constexpr ValueKind kind = *value_kind_of<T>();
    Codec<T> c;

    if constexpr (kind == ValueKind::Bool) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_bool(b, v); };
        c.read = [](ReadBuffer& b) { return wire::read_bool(b); };
        c.marker = Marker::Boolean;
    } else if constexpr (kind == ValueKind::Byte) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_byte(b, static_cast<int8_t>(v)); };
        c.read = [](ReadBuffer& b) { return static_cast<T>(wire::read_byte(b)); };
        c.marker = Marker::Byte;
    } else if constexpr (kind == ValueKind::Short) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_short(b, static_cast<int16_t>(v)); };
        c.read = [](ReadBuffer& b) { return static_cast<T>(wire::read_short(b)); };
        c.marker = Marker::Short;
    } else if constexpr (kind == ValueKind::Char) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_char(b, static_cast<char16_t>(v)); };
        c.read = [](ReadBuffer& b) { return static_cast<T>(wire::read_char(b)); };
        c.marker = Marker::Char;
    } else if constexpr (kind == ValueKind::Int32) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_int32(b, static_cast<int32_t>(v)); };
        c.read = [](ReadBuffer& b) { return static_cast<T>(wire::read_int32(b)); };
        c.marker = Marker::Int32;
    } else if constexpr (kind == ValueKind::Int64) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_int64(b, static_cast<int64_t>(v)); };
        c.read = [](ReadBuffer& b) { return static_cast<T>(wire::read_int64(b)); };
        c.marker = Marker::Int64;
    } else if constexpr (kind == ValueKind::Float32) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_float32(b, v); };
        c.read = [](ReadBuffer& b) { return wire::read_float32(b); };
        c.marker = Marker::Float32;
    } else if constexpr (kind == ValueKind::Float64) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_float64(b, v); };
        c.read = [](ReadBuffer& b) { return wire::read_float64(b); };
        c.marker = Marker::Float64;
    } else if constexpr (kind == ValueKind::String) {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_string(b, v); };
        c.read = [](ReadBuffer& b) { return wire::read_string(b); };
        c.marker = Marker::String;
    } else {
        c.write = [](WriteBuffer& b, const T& v) { wire::write_uuid(b, v); };
        c.read = [](ReadBuffer& b) { return wire::read_uuid(b); };
        c.marker = Marker::Uuid;
    }

    if constexpr (kind == ValueKind::String) {
        c.max_size = [](const T& v) { return wire::max_string_size(v); };
    } else {
        c.max_size = [](const T&) { return wire::max_scalar_size(kind); };
    }
    return c;
}

template <typename E>
Codec<E> enum_codec(const TypeTable& table) {
    const TypeTable* t = &table;
    uint32_t ordinal = table.ordinal_of(typeid(E));

    Codec<E> c;
    c.write = [t, ordinal](WriteBuffer& b, const E& v) {
        t->write_enum(b, ordinal, enum_index(v));
    };
    c.read = [t, ordinal](ReadBuffer& b) {
        UserValue u = t->read_user_value(b);
        t->expect_ordinal(ordinal, u.ordinal);
        return std::any_cast<E>(std::move(u.value));
    };
    c.max_size = [](const E&) { return TypeTable::max_enum_size(); };
    c.marker = Marker::Enum;
    return c;
}

template <typename S, bool SameType>
Codec<S> record_codec(const TypeTable& table) {
    const TypeTable* t = &table;
    uint32_t ordinal = table.ordinal_of(typeid(S));

    Codec<S> c;
    if constexpr (SameType) {
        c.write = [t, ordinal](WriteBuffer& b, const S& v) { t->write_same_type(b, ordinal, &v); };
        c.max_size = [t, ordinal](const S& v) { return t->max_same_type_size(ordinal, &v); };
        c.marker = Marker::SameType;
    } else {
        c.write = [t, ordinal](WriteBuffer& b, const S& v) { t->write_record(b, ordinal, &v); };
        c.max_size = [t, ordinal](const S& v) { return t->max_record_size(ordinal, &v); };
        c.marker = Marker::Record;
    }
    c.read = [t, ordinal](ReadBuffer& b) {
        if (b.peek_marker() == static_cast<int32_t>(Marker::SameType)) {
            b.get_marker();
            return std::any_cast<S>(t->read_same_type(b, ordinal));
        }
        UserValue u = t->read_user_value(b);
        t->expect_ordinal(ordinal, u.ordinal);
        return std::any_cast<S>(std::move(u.value));
    };
    return c;
}

// Variant decoding: one converter per ordinal of the table, set for the
// ordinals that are (possibly nested) alternatives of V.
template <typename V>
using Converters = std::vector<std::function<V(std::any&&)>>;

template <typename V>
Converters<V> variant_converters(const TypeTable& table);

template <typename V, typename A>
void add_alternative(const TypeTable& table, Converters<V>& out) {
    if constexpr (user_type<A>) {
        out[table.ordinal_of(typeid(A))] = [](std::any&& value) {
            return V(std::in_place_type<A>, std::any_cast<A>(std::move(value)));
        };
    } else if constexpr (detail::is_variant_v<A>) {
        Converters<A> inner = variant_converters<A>(table);
        for (size_t ordinal = 0; ordinal < inner.size(); ++ordinal) {
            if (inner[ordinal]) {
                out[ordinal] = [convert = std::move(inner[ordinal])](std::any&& value) {
                    return V(std::in_place_type<A>, convert(std::move(value)));
                };
            }
        }
    } else {
        detail::unsupported<A>("closed variant");
    }
}

template <typename V>
Converters<V> variant_converters(const TypeTable& table) {
    Converters<V> out(table.size());
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (add_alternative<V, std::variant_alternative_t<I, V>>(table, out), ...);
    }(std::make_index_sequence<std::variant_size_v<V>>{});
    return out;
}

template <typename V>
using AlternativeWriters = std::array<std::function<void(WriteBuffer&, const V&)>,
                                      std::variant_size_v<V>>;
template <typename V>
using AlternativeSizers = std::array<std::function<size_t(const V&)>, std::variant_size_v<V>>;

template <typename V, std::size_t I>
void set_alternative(const TypeTable& table, AlternativeWriters<V>& writers,
                     AlternativeSizers<V>& sizers) {
    auto alt = make_codec<std::variant_alternative_t<I, V>, void>(table);
    writers[I] = [alt](WriteBuffer& b, const V& v) { alt.write(b, *std::get_if<I>(&v)); };
    sizers[I] = [alt](const V& v) { return alt.max_size(*std::get_if<I>(&v)); };
}

template <typename V>
Codec<V> variant_codec(const TypeTable& table) {
    // Alternatives are encoded through ordinal dispatch; indexed by V::index()
    auto writers = std::make_shared<AlternativeWriters<V>>();
    auto sizers = std::make_shared<AlternativeSizers<V>>();
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (set_alternative<V, I>(table, *writers, *sizers), ...);
    }(std::make_index_sequence<std::variant_size_v<V>>{});

    auto converters = std::make_shared<const Converters<V>>(variant_converters<V>(table));
    const TypeTable* t = &table;

    Codec<V> c;
    c.write = [writers](WriteBuffer& b, const V& v) {
        if (v.valueless_by_exception()) {
            throw EncodeError(fmt::format("Cannot encode a valueless {}", type_name_of<V>()));
        }
        (*writers)[v.index()](b, v);
    };
    c.read = [t, converters](ReadBuffer& b) {
        UserValue u = t->read_user_value(b);
        const auto& convert = (*converters)[u.ordinal];
        if (!convert) {
            throw DecodeError(fmt::format("{} is not an alternative of {}",
                                          t->type_at(u.ordinal), type_name_of<V>()));
        }
        return convert(std::move(u.value));
    };
    c.max_size = [sizers](const V& v) -> size_t {
        if (v.valueless_by_exception()) {
            return 0;
        }
        return (*sizers)[v.index()](v);
    };
    c.marker = Marker::Record;
    return c;
}

template <typename P, typename Enclosing>
Codec<P> boxed_codec(const TypeTable& table) {
    using U = detail::pointee_t<P>;
    using Element = typename P::element_type;
    auto inner = make_codec<U, Enclosing>(table);

    Codec<P> c;
    c.write = [inner](WriteBuffer& b, const P& v) {
        if (!v) {
            b.put_marker(Marker::Null);
        } else {
            inner.write(b, *v);
        }
    };
    c.read = [inner](ReadBuffer& b) -> P {
        if (b.peek_marker() == static_cast<int32_t>(Marker::Null)) {
            b.get_marker();
            return nullptr;
        }
        return std::shared_ptr<Element>(std::make_shared<U>(inner.read(b)));
    };
    c.max_size = [inner](const P& v) { return v ? inner.max_size(*v) : size_t{MARKER_BYTES}; };
    c.marker = inner.marker;
    return c;
}

template <typename O, typename Enclosing>
Codec<O> optional_codec(const TypeTable& table) {
    auto inner = make_codec<typename O::value_type, Enclosing>(table);

    Codec<O> c;
    c.write = [inner](WriteBuffer& b, const O& v) {
        if (!v) {
            b.put_marker(Marker::OptionalEmpty);
            return;
        }
        b.put_marker(Marker::OptionalPresent);
        inner.write(b, *v);
    };
    c.read = [inner](ReadBuffer& b) -> O {
        size_t at = b.position();
        int32_t m = b.get_marker();
        if (m == static_cast<int32_t>(Marker::OptionalEmpty)) {
            return std::nullopt;
        }
        if (m != static_cast<int32_t>(Marker::OptionalPresent)) {
            throw DecodeError(fmt::format("Expected an optional marker at position {} but found {}",
                                          at, marker_name(static_cast<Marker>(m))));
        }
        return inner.read(b);
    };
    c.max_size = [inner](const O& v) {
        return MARKER_BYTES + (v ? inner.max_size(*v) : 0);
    };
    c.marker = Marker::OptionalPresent;
    return c;
}

template <typename L, typename Enclosing>
Codec<L> list_codec(const TypeTable& table) {
    auto inner = make_codec<typename L::value_type, Enclosing>(table);

    Codec<L> c;
    c.write = [inner](WriteBuffer& b, const L& v) {
        b.put_marker(Marker::List);
        wire::write_count(b, v.size());
        for (const auto& e : v) {
            inner.write(b, e);
        }
    };
    c.read = [inner](ReadBuffer& b) {
        b.expect_marker(Marker::List, "list");
        uint32_t count = wire::read_count(b, "list");
        L out;
        for (uint32_t i = 0; i < count; ++i) {
            out.push_back(inner.read(b));
        }
        return out;
    };
    c.max_size = [inner](const L& v) {
        size_t size = MARKER_BYTES + MAX_VARINT32_BYTES;
        for (const auto& e : v) size += inner.max_size(e);
        return size;
    };
    c.marker = Marker::List;
    return c;
}

template <typename M, typename Enclosing>
Codec<M> map_codec(const TypeTable& table) {
    auto keys = make_codec<typename M::key_type, Enclosing>(table);
    auto values = make_codec<typename M::mapped_type, Enclosing>(table);

    Codec<M> c;
    c.write = [keys, values](WriteBuffer& b, const M& v) {
        b.put_marker(Marker::Map);
        wire::write_count(b, v.size());
        for (const auto& [key, value] : v) {
            keys.write(b, key);
            values.write(b, value);
        }
    };
    c.read = [keys, values](ReadBuffer& b) {
        b.expect_marker(Marker::Map, "map");
        uint32_t count = wire::read_count(b, "map", 2);
        M out;
        for (uint32_t i = 0; i < count; ++i) {
            auto key = keys.read(b);
            auto value = values.read(b);
            out.emplace(std::move(key), std::move(value));
        }
        return out;
    };
    c.max_size = [keys, values](const M& v) {
        size_t size = MARKER_BYTES + MAX_VARINT32_BYTES;
        for (const auto& [key, value] : v) size += keys.max_size(key) + values.max_size(value);
        return size;
    };
    c.marker = Marker::Map;
    return c;
}

template <typename A>
void check_fixed_length(size_t length) {
    if constexpr (detail::is_std_array_v<A>) {
        if (length != std::tuple_size_v<A>) {
            throw DecodeError(fmt::format("Array of length {} cannot fill a fixed array of {}",
                                          length, std::tuple_size_v<A>));
        }
    }
}

// Copy decoded elements into a vector or a fixed array
template <typename A, typename Source>
A to_container(Source&& decoded) {
    using E = typename A::value_type;
    check_fixed_length<A>(decoded.size());
    A out{};
    if constexpr (detail::is_std_array_v<A>) {
        for (size_t i = 0; i < decoded.size(); ++i) {
            out[i] = static_cast<E>(std::move(decoded[i]));
        }
    } else {
        out.reserve(decoded.size());
        for (auto& e : decoded) {
            out.push_back(static_cast<E>(std::move(e)));
        }
    }
    return out;
}

// View of an integer array as its signed counterpart (same size, same bits)
template <typename Signed, typename A>
std::span<const Signed> as_signed(const A& v) {
    static_assert(sizeof(typename A::value_type) == sizeof(Signed));
    return {reinterpret_cast<const Signed*>(v.data()), v.size()};
}

template <typename A, typename Enclosing>
Codec<A> array_codec(const TypeTable& table) {
    using E = typename A::value_type;

    Codec<A> c;
    c.marker = Marker::Array;

    if constexpr (is_scalar_kind_v<E>) {
        constexpr ValueKind kind = *value_kind_of<E>();

        if constexpr (kind == ValueKind::Bool) {
            c.write = [](WriteBuffer& b, const A& v) {
                std::vector<uint8_t> bits((v.size() + 7) / 8);
                for (size_t i = 0; i < v.size(); ++i) {
                    if (v[i]) bits[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
                }
                wire::write_bool_array(b, v.size(), bits);
            };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_bool_array(b)); };
        } else if constexpr (kind == ValueKind::Byte) {
            c.write = [](WriteBuffer& b, const A& v) { wire::write_byte_array(b, as_signed<int8_t>(v)); };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_byte_array(b)); };
        } else if constexpr (kind == ValueKind::Short) {
            c.write = [](WriteBuffer& b, const A& v) { wire::write_short_array(b, as_signed<int16_t>(v)); };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_short_array(b)); };
        } else if constexpr (kind == ValueKind::Char) {
            c.write = [](WriteBuffer& b, const A& v) {
                if constexpr (std::is_same_v<E, char16_t>) {
                    wire::write_char_array(b, std::span<const char16_t>(v.data(), v.size()));
                } else {
                    std::vector<char16_t> wide(v.begin(), v.end());
                    wire::write_char_array(b, wide);
                }
            };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_char_array(b)); };
        } else if constexpr (kind == ValueKind::Int32) {
            c.write = [](WriteBuffer& b, const A& v) { wire::write_int32_array(b, as_signed<int32_t>(v)); };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_int32_array(b)); };
        } else if constexpr (kind == ValueKind::Int64) {
            c.write = [](WriteBuffer& b, const A& v) { wire::write_int64_array(b, as_signed<int64_t>(v)); };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_int64_array(b)); };
        } else if constexpr (kind == ValueKind::Float32) {
            c.write = [](WriteBuffer& b, const A& v) { wire::write_float32_array(b, std::span<const float>(v.data(), v.size())); };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_float32_array(b)); };
        } else if constexpr (kind == ValueKind::Float64) {
            c.write = [](WriteBuffer& b, const A& v) { wire::write_float64_array(b, std::span<const double>(v.data(), v.size())); };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_float64_array(b)); };
        } else if constexpr (kind == ValueKind::String) {
            c.write = [](WriteBuffer& b, const A& v) { wire::write_string_array(b, std::span<const std::string>(v.data(), v.size())); };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_string_array(b)); };
        } else {
            c.write = [](WriteBuffer& b, const A& v) { wire::write_uuid_array(b, std::span<const Uuid>(v.data(), v.size())); };
            c.read = [](ReadBuffer& b) { return to_container<A>(wire::read_uuid_array(b)); };
        }

        c.max_size = [](const A& v) {
            size_t size = wire::max_packed_array_size(kind, v.size());
            if constexpr (kind == ValueKind::String) {
                for (const auto& s : v) size += s.size();
            }
            return size;
        };
    } else {
        auto inner = make_codec<E, Enclosing>(table);
        c.write = [inner](WriteBuffer& b, const A& v) {
            wire::write_array_header(b, inner.marker, v.size());
            for (const auto& e : v) {
                inner.write(b, e);
            }
        };
        c.read = [inner](ReadBuffer& b) {
            uint32_t length = wire::read_array_header(b, inner.marker, "array");
            check_fixed_length<A>(length);
            std::vector<E> decoded;
            decoded.reserve(length);
            for (uint32_t i = 0; i < length; ++i) {
                decoded.push_back(inner.read(b));
            }
            if constexpr (detail::is_vector_v<A>) {
                return decoded;
            } else {
                return to_container<A>(std::move(decoded));
            }
        };
        c.max_size = [inner](const A& v) {
            size_t size = MARKER_BYTES + MARKER_BYTES + MAX_VARINT32_BYTES;
            for (const auto& e : v) size += inner.max_size(e);
            return size;
        };
    }
    return c;
}

} // namespace detail

template <typename T, typename Enclosing>
Codec<T> make_codec(const TypeTable& table) {
    if constexpr (detail::is_array_like_v<T>) {
        return detail::array_codec<T, Enclosing>(table);
    } else if constexpr (detail::is_list_like_v<T>) {
        return detail::list_codec<T, Enclosing>(table);
    } else if constexpr (detail::is_optional_v<T>) {
        return detail::optional_codec<T, Enclosing>(table);
    } else if constexpr (detail::is_map_like_v<T>) {
        return detail::map_codec<T, Enclosing>(table);
    } else if constexpr (detail::is_shared_ptr_v<T>) {
        using U = detail::pointee_t<T>;
        if constexpr (user_type<U> || detail::is_variant_v<U>) {
            return detail::boxed_codec<T, Enclosing>(table);
        } else {
            detail::unsupported<T>("codec");
        }
    } else if constexpr (described_enum<T>) {
        return detail::enum_codec<T>(table);
    } else if constexpr (described_record<T>) {
        return detail::record_codec<T, std::is_same_v<T, Enclosing>>(table);
    } else if constexpr (detail::is_variant_v<T>) {
        return detail::variant_codec<T>(table);
    } else if constexpr (is_scalar_kind_v<T>) {
        return detail::scalar_codec<T>();
    } else {
        detail::unsupported<T>("codec");
    }
}

} // namespace pickler
