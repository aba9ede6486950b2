#include "pickler/varint.hpp"
#include "pickler/buffer.hpp"
#include "pickler/errors.hpp"

namespace pickler::varint {

namespace {

constexpr uint64_t CONTINUATION = 0x80;
constexpr uint64_t PAYLOAD = 0x7F;

} // anonymous namespace

uint32_t size_of(int32_t value) {
    uint32_t v = zigzag(value);
    uint32_t length = 1;
    while (v >= CONTINUATION) {
        v >>= 7;
        ++length;
    }
    return length;
}

uint32_t size_of(int64_t value) {
    uint64_t v = zigzag(value);
    uint32_t length = 1;
    while (v >= CONTINUATION && length < 8) {
        v >>= 7;
        ++length;
    }
    // Anything left after 56 bits fits the uncapped ninth byte
    if (v >= CONTINUATION) {
        ++length;
    }
    return length;
}

uint32_t encode(WriteBuffer& buffer, int32_t value) {
    uint32_t v = zigzag(value);
    uint32_t count = 0;
    while (v >= CONTINUATION) {
        buffer.put_u8(static_cast<uint8_t>((v & PAYLOAD) | CONTINUATION));
        v >>= 7;
        ++count;
    }
    buffer.put_u8(static_cast<uint8_t>(v));
    return count + 1;
}

uint32_t encode(WriteBuffer& buffer, int64_t value) {
    uint64_t v = zigzag(value);
    uint32_t count = 0;
    while (v >= CONTINUATION && count < 8) {
        buffer.put_u8(static_cast<uint8_t>((v & PAYLOAD) | CONTINUATION));
        v >>= 7;
        ++count;
    }
    buffer.put_u8(static_cast<uint8_t>(v));
    return count + 1;
}

int32_t decode32(ReadBuffer& buffer) {
    uint32_t result = 0;
    for (uint32_t i = 0; i < 5; ++i) {
        uint8_t b = buffer.get_u8();
        result |= static_cast<uint32_t>(b & PAYLOAD) << (7 * i);
        if ((b & CONTINUATION) == 0) {
            return unzigzag(result);
        }
    }
    throw DecodeError("Malformed varint: no terminating byte within 5 bytes");
}

int64_t decode64(ReadBuffer& buffer) {
    uint64_t result = 0;
    for (uint32_t i = 0; i < 8; ++i) {
        uint8_t b = buffer.get_u8();
        result |= static_cast<uint64_t>(b & PAYLOAD) << (7 * i);
        if ((b & CONTINUATION) == 0) {
            return unzigzag(result);
        }
    }
    uint8_t last = buffer.get_u8();
    result |= static_cast<uint64_t>(last) << 56;
    return unzigzag(result);
}

} // namespace pickler::varint
