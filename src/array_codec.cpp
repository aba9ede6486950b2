#include "pickler/wire.hpp"
#include "pickler/errors.hpp"
#include "pickler/varint.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace pickler::wire {

namespace {

// Average zig-zag varint size over the first ARRAY_SAMPLE_SIZE elements
template <typename T>
uint32_t sampled_average_size(std::span<const T> values) {
    size_t sample = std::min<size_t>(values.size(), ARRAY_SAMPLE_SIZE);
    if (sample == 0) {
        return 1;
    }
    uint64_t total = 0;
    for (size_t i = 0; i < sample; ++i) {
        total += varint::size_of(values[i]);
    }
    return static_cast<uint32_t>(total / sample);
}

template <typename T>
bool prefer_varint(std::span<const T> values) {
    constexpr uint32_t width = sizeof(T);
    uint32_t average = sampled_average_size(values);
    uint32_t saving = values.size() <= ARRAY_SAMPLE_SIZE ? SMALL_ARRAY_MIN_SAVING
                                                         : LARGE_ARRAY_MIN_SAVING;
    return average + saving < width;
}

void put_header(WriteBuffer& buffer, Marker element, size_t length) {
    buffer.put_marker(Marker::Array);
    buffer.put_marker(element);
    write_count(buffer, length);
}

// Reads ARRAY marker and element marker, returning the element marker
int32_t get_element_marker(ReadBuffer& buffer, std::string_view context) {
    buffer.expect_marker(Marker::Array, context);
    return buffer.get_marker();
}

void require_marker(int32_t found, Marker expected, std::string_view context) {
    if (found != static_cast<int32_t>(expected)) {
        throw DecodeError(fmt::format("Expected {} elements in {} but found {}",
                                      marker_name(expected), context,
                                      marker_name(static_cast<Marker>(found))));
    }
}

template <typename T, typename Read>
std::vector<T> read_fixed(ReadBuffer& buffer, Marker element, std::string_view context,
                          size_t width, Read read_one) {
    require_marker(get_element_marker(buffer, context), element, context);
    uint32_t length = read_count(buffer, context, width);
    std::vector<T> out;
    out.reserve(length);
    for (uint32_t i = 0; i < length; ++i) {
        out.push_back(read_one());
    }
    return out;
}

} // anonymous namespace

Marker choose_int32_width(std::span<const int32_t> values) {
    return prefer_varint(values) ? Marker::Int32Var : Marker::Int32;
}

Marker choose_int64_width(std::span<const int64_t> values) {
    return prefer_varint(values) ? Marker::Int64Var : Marker::Int64;
}

void write_int32_array(WriteBuffer& buffer, std::span<const int32_t> values) {
    Marker element = choose_int32_width(values);
    put_header(buffer, element, values.size());
    if (element == Marker::Int32Var) {
        for (int32_t v : values) varint::encode(buffer, v);
    } else {
        for (int32_t v : values) buffer.put_i32(v);
    }
}

void write_int64_array(WriteBuffer& buffer, std::span<const int64_t> values) {
    Marker element = choose_int64_width(values);
    put_header(buffer, element, values.size());
    if (element == Marker::Int64Var) {
        for (int64_t v : values) varint::encode(buffer, v);
    } else {
        for (int64_t v : values) buffer.put_i64(v);
    }
}

void write_bool_array(WriteBuffer& buffer, size_t length, std::span<const uint8_t> bits) {
    put_header(buffer, Marker::Boolean, length);
    write_count(buffer, bits.size());
    buffer.put_bytes(bits.data(), bits.size());
}

void write_byte_array(WriteBuffer& buffer, std::span<const int8_t> values) {
    put_header(buffer, Marker::Byte, values.size());
    buffer.put_bytes(values.data(), values.size());
}

void write_short_array(WriteBuffer& buffer, std::span<const int16_t> values) {
    put_header(buffer, Marker::Short, values.size());
    for (int16_t v : values) buffer.put_i16(v);
}

void write_char_array(WriteBuffer& buffer, std::span<const char16_t> values) {
    put_header(buffer, Marker::Char, values.size());
    for (char16_t v : values) buffer.put_i16(static_cast<int16_t>(v));
}

void write_float32_array(WriteBuffer& buffer, std::span<const float> values) {
    put_header(buffer, Marker::Float32, values.size());
    for (float v : values) buffer.put_f32(v);
}

void write_float64_array(WriteBuffer& buffer, std::span<const double> values) {
    put_header(buffer, Marker::Float64, values.size());
    for (double v : values) buffer.put_f64(v);
}

void write_string_array(WriteBuffer& buffer, std::span<const std::string> values) {
    put_header(buffer, Marker::String, values.size());
    for (const auto& v : values) put_string_body(buffer, v);
}

void write_uuid_array(WriteBuffer& buffer, std::span<const Uuid> values) {
    put_header(buffer, Marker::Uuid, values.size());
    for (const auto& v : values) put_uuid_body(buffer, v);
}

std::vector<int32_t> read_int32_array(ReadBuffer& buffer) {
    int32_t element = get_element_marker(buffer, "int32 array");
    if (element == static_cast<int32_t>(Marker::Int32Var)) {
        uint32_t length = read_count(buffer, "int32 array");
        std::vector<int32_t> out;
        out.reserve(length);
        for (uint32_t i = 0; i < length; ++i) out.push_back(varint::decode32(buffer));
        return out;
    }
    require_marker(element, Marker::Int32, "int32 array");
    uint32_t length = read_count(buffer, "int32 array", sizeof(int32_t));
    std::vector<int32_t> out;
    out.reserve(length);
    for (uint32_t i = 0; i < length; ++i) out.push_back(buffer.get_i32());
    return out;
}

std::vector<int64_t> read_int64_array(ReadBuffer& buffer) {
    int32_t element = get_element_marker(buffer, "int64 array");
    if (element == static_cast<int32_t>(Marker::Int64Var)) {
        uint32_t length = read_count(buffer, "int64 array");
        std::vector<int64_t> out;
        out.reserve(length);
        for (uint32_t i = 0; i < length; ++i) out.push_back(varint::decode64(buffer));
        return out;
    }
    require_marker(element, Marker::Int64, "int64 array");
    uint32_t length = read_count(buffer, "int64 array", sizeof(int64_t));
    std::vector<int64_t> out;
    out.reserve(length);
    for (uint32_t i = 0; i < length; ++i) out.push_back(buffer.get_i64());
    return out;
}

std::vector<uint8_t> read_bool_array(ReadBuffer& buffer) {
    require_marker(get_element_marker(buffer, "bool array"), Marker::Boolean, "bool array");
    uint32_t length = read_count(buffer, "bool array", 0);
    size_t at = buffer.position();
    uint32_t byte_count = read_count(buffer, "bool array bitset");
    if (byte_count != (static_cast<size_t>(length) + 7) / 8) {
        throw DecodeError(fmt::format(
            "Bool array of {} elements at position {} has a {}-byte bitset",
            length, at, byte_count));
    }
    std::vector<uint8_t> bits(byte_count);
    buffer.get_bytes(bits.data(), bits.size());

    std::vector<uint8_t> out(length);
    for (uint32_t i = 0; i < length; ++i) {
        out[i] = (bits[i / 8] >> (i % 8)) & 1;
    }
    return out;
}

std::vector<int8_t> read_byte_array(ReadBuffer& buffer) {
    require_marker(get_element_marker(buffer, "byte array"), Marker::Byte, "byte array");
    uint32_t length = read_count(buffer, "byte array");
    std::vector<int8_t> out(length);
    buffer.get_bytes(out.data(), out.size());
    return out;
}

std::vector<int16_t> read_short_array(ReadBuffer& buffer) {
    return read_fixed<int16_t>(buffer, Marker::Short, "short array", 2,
                               [&] { return buffer.get_i16(); });
}

std::vector<char16_t> read_char_array(ReadBuffer& buffer) {
    return read_fixed<char16_t>(buffer, Marker::Char, "char array", 2,
                                [&] { return static_cast<char16_t>(buffer.get_i16()); });
}

std::vector<float> read_float32_array(ReadBuffer& buffer) {
    return read_fixed<float>(buffer, Marker::Float32, "float32 array", 4,
                             [&] { return buffer.get_f32(); });
}

std::vector<double> read_float64_array(ReadBuffer& buffer) {
    return read_fixed<double>(buffer, Marker::Float64, "float64 array", 8,
                              [&] { return buffer.get_f64(); });
}

std::vector<std::string> read_string_array(ReadBuffer& buffer) {
    return read_fixed<std::string>(buffer, Marker::String, "string array", 1,
                                   [&] { return get_string_body(buffer); });
}

std::vector<Uuid> read_uuid_array(ReadBuffer& buffer) {
    return read_fixed<Uuid>(buffer, Marker::Uuid, "uuid array", UUID_BYTES,
                            [&] { return get_uuid_body(buffer); });
}

size_t max_packed_array_size(ValueKind kind, size_t length) {
    size_t header = MARKER_BYTES + MARKER_BYTES + MAX_VARINT32_BYTES;
    switch (kind) {
        case ValueKind::Bool:
            return header + MAX_VARINT32_BYTES + (length + 7) / 8;
        case ValueKind::Byte:
            return header + length;
        case ValueKind::Short:
        case ValueKind::Char:
            return header + 2 * length;
        case ValueKind::Int32:
            return header + MAX_VARINT32_BYTES * length;
        case ValueKind::Int64:
            return header + MAX_VARINT64_BYTES * length;
        case ValueKind::Float32:
            return header + 4 * length;
        case ValueKind::Float64:
            return header + 8 * length;
        case ValueKind::String:
            return header + MAX_VARINT32_BYTES * length;
        case ValueKind::Uuid:
            return header + UUID_BYTES * length;
        case ValueKind::Enum:
        case ValueKind::Structured:
        case ValueKind::ClosedVariant:
            break;
    }
    throw Error(fmt::format("{} arrays are not packed", value_kind_name(kind)));
}

void write_array_header(WriteBuffer& buffer, Marker element, size_t length) {
    put_header(buffer, element, length);
}

uint32_t read_array_header(ReadBuffer& buffer, Marker element, std::string_view context) {
    require_marker(get_element_marker(buffer, context), element, context);
    return read_count(buffer, context);
}

} // namespace pickler::wire
