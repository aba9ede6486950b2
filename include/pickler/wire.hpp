#pragma once

#include "buffer.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pickler::wire {

// Scalars: marker followed by the value. Integers take their varint form
// only when it is strictly shorter than the fixed width.
void write_bool(WriteBuffer& buffer, bool v);
void write_byte(WriteBuffer& buffer, int8_t v);
void write_short(WriteBuffer& buffer, int16_t v);
void write_char(WriteBuffer& buffer, char16_t v);
void write_int32(WriteBuffer& buffer, int32_t v);
void write_int64(WriteBuffer& buffer, int64_t v);
void write_float32(WriteBuffer& buffer, float v);
void write_float64(WriteBuffer& buffer, double v);
void write_string(WriteBuffer& buffer, std::string_view v);
void write_uuid(WriteBuffer& buffer, const Uuid& v);

bool read_bool(ReadBuffer& buffer);
int8_t read_byte(ReadBuffer& buffer);
int16_t read_short(ReadBuffer& buffer);
char16_t read_char(ReadBuffer& buffer);
int32_t read_int32(ReadBuffer& buffer);
int64_t read_int64(ReadBuffer& buffer);
float read_float32(ReadBuffer& buffer);
double read_float64(ReadBuffer& buffer);
std::string read_string(ReadBuffer& buffer);
Uuid read_uuid(ReadBuffer& buffer);

// Upper bound of a scalar of `kind`, marker included. Strings add their length.
size_t max_scalar_size(ValueKind kind);
size_t max_string_size(std::string_view v);

// Unmarked bodies, shared with packed arrays
void put_string_body(WriteBuffer& buffer, std::string_view v);
std::string get_string_body(ReadBuffer& buffer);
void put_uuid_body(WriteBuffer& buffer, const Uuid& v);
Uuid get_uuid_body(ReadBuffer& buffer);

// Read a varint count and check that at least `min_bytes_each` bytes per
// entry remain, so corrupted counts fail before any allocation.
uint32_t read_count(ReadBuffer& buffer, std::string_view context, size_t min_bytes_each = 1);
void write_count(WriteBuffer& buffer, size_t count);

// Packed arrays: ARRAY marker, element marker, varint(length), elements
// without per-element markers.

// Width chosen for a packed int32/int64 array: the varint marker when the
// sampled average saves enough bytes per element, else the fixed one.
Marker choose_int32_width(std::span<const int32_t> values);
Marker choose_int64_width(std::span<const int64_t> values);

void write_int32_array(WriteBuffer& buffer, std::span<const int32_t> values);
void write_int64_array(WriteBuffer& buffer, std::span<const int64_t> values);
void write_bool_array(WriteBuffer& buffer, size_t length, std::span<const uint8_t> bits);
void write_byte_array(WriteBuffer& buffer, std::span<const int8_t> values);
void write_short_array(WriteBuffer& buffer, std::span<const int16_t> values);
void write_char_array(WriteBuffer& buffer, std::span<const char16_t> values);
void write_float32_array(WriteBuffer& buffer, std::span<const float> values);
void write_float64_array(WriteBuffer& buffer, std::span<const double> values);
void write_string_array(WriteBuffer& buffer, std::span<const std::string> values);
void write_uuid_array(WriteBuffer& buffer, std::span<const Uuid> values);

// Readers consume the whole array, ARRAY marker included
std::vector<int32_t> read_int32_array(ReadBuffer& buffer);
std::vector<int64_t> read_int64_array(ReadBuffer& buffer);
// Bool arrays decode to one byte (0 or 1) per element
std::vector<uint8_t> read_bool_array(ReadBuffer& buffer);
std::vector<int8_t> read_byte_array(ReadBuffer& buffer);
std::vector<int16_t> read_short_array(ReadBuffer& buffer);
std::vector<char16_t> read_char_array(ReadBuffer& buffer);
std::vector<float> read_float32_array(ReadBuffer& buffer);
std::vector<double> read_float64_array(ReadBuffer& buffer);
std::vector<std::string> read_string_array(ReadBuffer& buffer);
std::vector<Uuid> read_uuid_array(ReadBuffer& buffer);

// Upper bound of a packed array of `length` elements of `kind`, markers
// and length included. Strings add the sum of their lengths on top.
size_t max_packed_array_size(ValueKind kind, size_t length);

// Header of an array whose elements are written by their own codec
void write_array_header(WriteBuffer& buffer, Marker element, size_t length);
uint32_t read_array_header(ReadBuffer& buffer, Marker element, std::string_view context);

} // namespace pickler::wire
