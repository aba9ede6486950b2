#pragma once

#include "types.hpp"
#include "interning.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace pickler {

// Bounded big-endian output buffer. Owns the interning session for
// everything written into it; a buffer must not be shared between threads.
class WriteBuffer {
public:
    // Allocate and own `capacity` bytes
    explicit WriteBuffer(size_t capacity);

    // Write into caller-provided memory
    explicit WriteBuffer(std::span<uint8_t> storage);

    WriteBuffer(const WriteBuffer&) = delete;
    WriteBuffer& operator=(const WriteBuffer&) = delete;
    WriteBuffer(WriteBuffer&&) noexcept = default;
    WriteBuffer& operator=(WriteBuffer&&) noexcept = default;

    void put_u8(uint8_t v);
    void put_i16(int16_t v);
    void put_i32(int32_t v);
    void put_i64(int64_t v);
    void put_f32(float v);
    void put_f64(double v);
    void put_bytes(const void* data, size_t size);
    void put_marker(Marker m);

    size_t position() const { return position_; }
    size_t capacity() const { return capacity_; }
    size_t remaining() const { return capacity_ - position_; }
    bool is_closed() const { return closed_; }

    // Bytes written so far
    std::span<const uint8_t> written() const { return {data_, position_}; }

    // Close the buffer for writing, discard the interning session and
    // return the written bytes.
    std::span<const uint8_t> flip();

    InterningSession& interning();

    uint32_t& depth_counter() { return depth_; }

private:
    std::vector<uint8_t> owned_;
    uint8_t* data_ = nullptr;
    size_t capacity_ = 0;
    size_t position_ = 0;
    bool closed_ = false;
    uint32_t depth_ = 0;
    std::unique_ptr<InterningSession> interning_;

    uint8_t* reserve(size_t size);
};

// Bounds-checked big-endian input cursor over borrowed bytes.
class ReadBuffer {
public:
    explicit ReadBuffer(std::span<const uint8_t> data);

    uint8_t get_u8();
    int16_t get_i16();
    int32_t get_i32();
    int64_t get_i64();
    float get_f32();
    double get_f64();
    void get_bytes(void* out, size_t size);
    std::string get_string(size_t size);

    // Read a marker varint; anything outside the marker range is a DecodeError
    int32_t get_marker();
    // Read a marker and require it to be `expected`
    void expect_marker(Marker expected, std::string_view context);
    int32_t peek_marker();

    size_t position() const { return position_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - position_; }
    bool has_remaining() const { return position_ < data_.size(); }
    void seek(size_t position);
    void skip(size_t size);

    std::span<const uint8_t> data() const { return data_; }

    uint32_t& depth_counter() { return depth_; }

private:
    std::span<const uint8_t> data_;
    size_t position_ = 0;
    uint32_t depth_ = 0;

    const uint8_t* consume(size_t size);
};

// Counts nesting of structured values; throws DepthExceededError past the limit
class DepthGuard {
public:
    DepthGuard(uint32_t& depth, uint32_t max_depth);
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    uint32_t& depth_;
};

} // namespace pickler
