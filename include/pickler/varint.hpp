#pragma once

#include <cstdint>

namespace pickler {

class WriteBuffer;
class ReadBuffer;

// Zig-zag LEB128 with a 9-byte cap for 64-bit values: the ninth byte holds
// the final 8 bits and has no continuation bit.
namespace varint {

constexpr uint32_t zigzag(int32_t v) {
    return (static_cast<uint32_t>(v) << 1) ^ static_cast<uint32_t>(v >> 31);
}

constexpr uint64_t zigzag(int64_t v) {
    return (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
}

constexpr int32_t unzigzag(uint32_t v) {
    return static_cast<int32_t>((v >> 1) ^ (~(v & 1) + 1));
}

constexpr int64_t unzigzag(uint64_t v) {
    return static_cast<int64_t>((v >> 1) ^ (~(v & 1) + 1));
}

// Exact number of bytes encode() writes for `value`
uint32_t size_of(int32_t value);
uint32_t size_of(int64_t value);

uint32_t encode(WriteBuffer& buffer, int32_t value);
uint32_t encode(WriteBuffer& buffer, int64_t value);

int32_t decode32(ReadBuffer& buffer);
int64_t decode64(ReadBuffer& buffer);

} // namespace varint

} // namespace pickler
