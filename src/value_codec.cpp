#include "pickler/wire.hpp"
#include "pickler/errors.hpp"
#include "pickler/varint.hpp"

#include <fmt/format.h>

#include <limits>

namespace pickler::wire {

namespace {

void expect(ReadBuffer& buffer, Marker marker, std::string_view what) {
    buffer.expect_marker(marker, what);
}

// Reads a marker that must be one of two accepted forms
int32_t expect_either(ReadBuffer& buffer, Marker fixed, Marker var, std::string_view what) {
    size_t at = buffer.position();
    int32_t m = buffer.get_marker();
    if (m != static_cast<int32_t>(fixed) && m != static_cast<int32_t>(var)) {
        throw DecodeError(fmt::format("Expected {} or {} marker for {} at position {} but found {}",
                                      marker_name(fixed), marker_name(var), what, at,
                                      marker_name(static_cast<Marker>(m))));
    }
    return m;
}

} // anonymous namespace

void write_bool(WriteBuffer& buffer, bool v) {
    buffer.put_marker(Marker::Boolean);
    buffer.put_u8(v ? 1 : 0);
}

void write_byte(WriteBuffer& buffer, int8_t v) {
    buffer.put_marker(Marker::Byte);
    buffer.put_u8(static_cast<uint8_t>(v));
}

void write_short(WriteBuffer& buffer, int16_t v) {
    buffer.put_marker(Marker::Short);
    buffer.put_i16(v);
}

void write_char(WriteBuffer& buffer, char16_t v) {
    buffer.put_marker(Marker::Char);
    buffer.put_i16(static_cast<int16_t>(v));
}

void write_int32(WriteBuffer& buffer, int32_t v) {
    if (varint::size_of(v) < sizeof(int32_t)) {
        buffer.put_marker(Marker::Int32Var);
        varint::encode(buffer, v);
    } else {
        buffer.put_marker(Marker::Int32);
        buffer.put_i32(v);
    }
}

void write_int64(WriteBuffer& buffer, int64_t v) {
    if (varint::size_of(v) < sizeof(int64_t)) {
        buffer.put_marker(Marker::Int64Var);
        varint::encode(buffer, v);
    } else {
        buffer.put_marker(Marker::Int64);
        buffer.put_i64(v);
    }
}

void write_float32(WriteBuffer& buffer, float v) {
    buffer.put_marker(Marker::Float32);
    buffer.put_f32(v);
}

void write_float64(WriteBuffer& buffer, double v) {
    buffer.put_marker(Marker::Float64);
    buffer.put_f64(v);
}

void write_string(WriteBuffer& buffer, std::string_view v) {
    buffer.put_marker(Marker::String);
    put_string_body(buffer, v);
}

void write_uuid(WriteBuffer& buffer, const Uuid& v) {
    buffer.put_marker(Marker::Uuid);
    put_uuid_body(buffer, v);
}

bool read_bool(ReadBuffer& buffer) {
    expect(buffer, Marker::Boolean, "bool");
    return buffer.get_u8() != 0;
}

int8_t read_byte(ReadBuffer& buffer) {
    expect(buffer, Marker::Byte, "byte");
    return static_cast<int8_t>(buffer.get_u8());
}

int16_t read_short(ReadBuffer& buffer) {
    expect(buffer, Marker::Short, "short");
    return buffer.get_i16();
}

char16_t read_char(ReadBuffer& buffer) {
    expect(buffer, Marker::Char, "char");
    return static_cast<char16_t>(buffer.get_i16());
}

int32_t read_int32(ReadBuffer& buffer) {
    int32_t m = expect_either(buffer, Marker::Int32, Marker::Int32Var, "int32");
    if (m == static_cast<int32_t>(Marker::Int32Var)) {
        return varint::decode32(buffer);
    }
    return buffer.get_i32();
}

int64_t read_int64(ReadBuffer& buffer) {
    int32_t m = expect_either(buffer, Marker::Int64, Marker::Int64Var, "int64");
    if (m == static_cast<int32_t>(Marker::Int64Var)) {
        return varint::decode64(buffer);
    }
    return buffer.get_i64();
}

float read_float32(ReadBuffer& buffer) {
    expect(buffer, Marker::Float32, "float32");
    return buffer.get_f32();
}

double read_float64(ReadBuffer& buffer) {
    expect(buffer, Marker::Float64, "float64");
    return buffer.get_f64();
}

std::string read_string(ReadBuffer& buffer) {
    expect(buffer, Marker::String, "string");
    return get_string_body(buffer);
}

Uuid read_uuid(ReadBuffer& buffer) {
    expect(buffer, Marker::Uuid, "uuid");
    return get_uuid_body(buffer);
}

size_t max_scalar_size(ValueKind kind) {
    switch (kind) {
        case ValueKind::Bool:
        case ValueKind::Byte:
            return MARKER_BYTES + 1;
        case ValueKind::Short:
        case ValueKind::Char:
            return MARKER_BYTES + 2;
        case ValueKind::Int32:
        case ValueKind::Float32:
            return MARKER_BYTES + 4;
        case ValueKind::Int64:
        case ValueKind::Float64:
            return MARKER_BYTES + 8;
        case ValueKind::String:
            return MARKER_BYTES + MAX_VARINT32_BYTES;
        case ValueKind::Uuid:
            return MARKER_BYTES + UUID_BYTES;
        case ValueKind::Enum:
        case ValueKind::Structured:
        case ValueKind::ClosedVariant:
            break;
    }
    throw Error(fmt::format("{} is not a scalar kind", value_kind_name(kind)));
}

size_t max_string_size(std::string_view v) {
    return MARKER_BYTES + MAX_VARINT32_BYTES + v.size();
}

void put_string_body(WriteBuffer& buffer, std::string_view v) {
    if (v.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw EncodeError(fmt::format("String of {} bytes is too long to encode", v.size()));
    }
    varint::encode(buffer, static_cast<int32_t>(v.size()));
    buffer.put_bytes(v.data(), v.size());
}

std::string get_string_body(ReadBuffer& buffer) {
    size_t at = buffer.position();
    int32_t length = varint::decode32(buffer);
    if (length < 0 || static_cast<size_t>(length) > buffer.remaining()) {
        throw DecodeError(fmt::format("Invalid string length {} at position {}", length, at));
    }
    return buffer.get_string(static_cast<size_t>(length));
}

void put_uuid_body(WriteBuffer& buffer, const Uuid& v) {
    buffer.put_i64(static_cast<int64_t>(v.high));
    buffer.put_i64(static_cast<int64_t>(v.low));
}

Uuid get_uuid_body(ReadBuffer& buffer) {
    Uuid v;
    v.high = static_cast<uint64_t>(buffer.get_i64());
    v.low = static_cast<uint64_t>(buffer.get_i64());
    return v;
}

uint32_t read_count(ReadBuffer& buffer, std::string_view context, size_t min_bytes_each) {
    size_t at = buffer.position();
    int32_t count = varint::decode32(buffer);
    if (count < 0) {
        throw DecodeError(fmt::format("Negative {} count {} at position {}", context, count, at));
    }
    if (min_bytes_each > 0 && static_cast<size_t>(count) > buffer.remaining() / min_bytes_each) {
        throw DecodeError(fmt::format(
            "{} count {} at position {} exceeds the {} bytes remaining",
            context, count, at, buffer.remaining()));
    }
    return static_cast<uint32_t>(count);
}

void write_count(WriteBuffer& buffer, size_t count) {
    if (count > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw EncodeError(fmt::format("Container of {} elements is too large to encode", count));
    }
    varint::encode(buffer, static_cast<int32_t>(count));
}

} // namespace pickler::wire
