#include "pickler/buffer.hpp"
#include "pickler/errors.hpp"
#include "pickler/varint.hpp"

#include <fmt/format.h>

#include <bit>
#include <cstring>

namespace pickler {

// WriteBuffer implementation

WriteBuffer::WriteBuffer(size_t capacity)
    : owned_(capacity),
      data_(owned_.data()),
      capacity_(capacity),
      interning_(std::make_unique<InterningSession>()) {}

WriteBuffer::WriteBuffer(std::span<uint8_t> storage)
    : data_(storage.data()),
      capacity_(storage.size()),
      interning_(std::make_unique<InterningSession>()) {}

uint8_t* WriteBuffer::reserve(size_t size) {
    if (closed_) {
        throw EncodeError("WriteBuffer has been flipped and is read-only");
    }
    if (size > capacity_ - position_) {
        throw EncodeError(fmt::format(
            "WriteBuffer overflow: need {} bytes at position {} but capacity is {}",
            size, position_, capacity_));
    }
    uint8_t* p = data_ + position_;
    position_ += size;
    return p;
}

void WriteBuffer::put_u8(uint8_t v) {
    *reserve(1) = v;
}

void WriteBuffer::put_i16(int16_t v) {
    uint8_t* p = reserve(2);
    auto u = static_cast<uint16_t>(v);
    p[0] = static_cast<uint8_t>(u >> 8);
    p[1] = static_cast<uint8_t>(u);
}

void WriteBuffer::put_i32(int32_t v) {
    uint8_t* p = reserve(4);
    auto u = static_cast<uint32_t>(v);
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>(u >> (24 - 8 * i));
    }
}

void WriteBuffer::put_i64(int64_t v) {
    uint8_t* p = reserve(8);
    auto u = static_cast<uint64_t>(v);
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(u >> (56 - 8 * i));
    }
}

void WriteBuffer::put_f32(float v) {
    put_i32(std::bit_cast<int32_t>(v));
}

void WriteBuffer::put_f64(double v) {
    put_i64(std::bit_cast<int64_t>(v));
}

void WriteBuffer::put_bytes(const void* data, size_t size) {
    if (size == 0) return;
    std::memcpy(reserve(size), data, size);
}

void WriteBuffer::put_marker(Marker m) {
    varint::encode(*this, static_cast<int32_t>(m));
}

std::span<const uint8_t> WriteBuffer::flip() {
    closed_ = true;
    interning_.reset();
    return written();
}

InterningSession& WriteBuffer::interning() {
    if (!interning_) {
        throw EncodeError("WriteBuffer has been flipped; its interning session is gone");
    }
    return *interning_;
}

// ReadBuffer implementation

ReadBuffer::ReadBuffer(std::span<const uint8_t> data) : data_(data) {}

const uint8_t* ReadBuffer::consume(size_t size) {
    if (size > data_.size() - position_) {
        throw DecodeError(fmt::format(
            "Buffer underflow: need {} bytes at position {} but only {} remain",
            size, position_, data_.size() - position_));
    }
    const uint8_t* p = data_.data() + position_;
    position_ += size;
    return p;
}

uint8_t ReadBuffer::get_u8() {
    return *consume(1);
}

int16_t ReadBuffer::get_i16() {
    const uint8_t* p = consume(2);
    return static_cast<int16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

int32_t ReadBuffer::get_i32() {
    const uint8_t* p = consume(4);
    uint32_t u = 0;
    for (int i = 0; i < 4; ++i) {
        u = (u << 8) | p[i];
    }
    return static_cast<int32_t>(u);
}

int64_t ReadBuffer::get_i64() {
    const uint8_t* p = consume(8);
    uint64_t u = 0;
    for (int i = 0; i < 8; ++i) {
        u = (u << 8) | p[i];
    }
    return static_cast<int64_t>(u);
}

float ReadBuffer::get_f32() {
    return std::bit_cast<float>(get_i32());
}

double ReadBuffer::get_f64() {
    return std::bit_cast<double>(get_i64());
}

void ReadBuffer::get_bytes(void* out, size_t size) {
    if (size == 0) return;
    std::memcpy(out, consume(size), size);
}

std::string ReadBuffer::get_string(size_t size) {
    const uint8_t* p = consume(size);
    return std::string(reinterpret_cast<const char*>(p), size);
}

int32_t ReadBuffer::get_marker() {
    size_t at = position_;
    int32_t m = varint::decode32(*this);
    if (!is_marker(m)) {
        throw DecodeError(fmt::format("Invalid marker {} at position {}", m, at));
    }
    return m;
}

void ReadBuffer::expect_marker(Marker expected, std::string_view context) {
    size_t at = position_;
    int32_t m = get_marker();
    if (m != static_cast<int32_t>(expected)) {
        throw DecodeError(fmt::format("Expected {} marker for {} at position {} but found {}",
                                      marker_name(expected), context, at,
                                      marker_name(static_cast<Marker>(m))));
    }
}

int32_t ReadBuffer::peek_marker() {
    size_t at = position_;
    int32_t m = get_marker();
    position_ = at;
    return m;
}

void ReadBuffer::seek(size_t position) {
    if (position > data_.size()) {
        throw DecodeError(fmt::format("Seek to {} is outside buffer of {} bytes",
                                      position, data_.size()));
    }
    position_ = position;
}

void ReadBuffer::skip(size_t size) {
    consume(size);
}

// DepthGuard implementation

DepthGuard::DepthGuard(uint32_t& depth, uint32_t max_depth) : depth_(depth) {
    if (depth_ >= max_depth) {
        throw DepthExceededError(fmt::format(
            "Structured value nesting exceeds maximum depth of {}", max_depth));
    }
    ++depth_;
}

} // namespace pickler
