#pragma once

#include "buffer.hpp"
#include "codec.hpp"
#include "descriptor.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "wire.hpp"
#include "detail/build.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <typeinfo>
#include <vector>

namespace pickler {

// Types that can be registered as the root of a pickler
template <typename T>
concept root_type = user_type<T> || detail::is_variant_v<T>;

// Encoder/decoder for one root type. Construction discovers every type
// reachable from T, assigns ordinals and builds the codec chains; after
// that a Pickler is immutable and may be shared between threads. Buffers
// are per call.
template <root_type T>
class Pickler {
public:
    explicit Pickler(Config config = Config::from_environment())
        : table_(detail::build_table<T>(config)),
          codec_(make_codec<T, void>(*table_)) {}

    // Write `value` at the buffer's position; returns the bytes written
    size_t encode(WriteBuffer& buffer, const T& value) const {
        size_t start = buffer.position();
        codec_.write(buffer, value);
        return buffer.position() - start;
    }

    // Encode into a buffer sized by max_encoded_size()
    std::vector<uint8_t> encode(const T& value) const {
        WriteBuffer buffer(max_encoded_size(value));
        encode(buffer, value);
        auto bytes = buffer.flip();
        return {bytes.begin(), bytes.end()};
    }

    T decode(ReadBuffer& buffer) const {
        try {
            return codec_.read(buffer);
        } catch (const Error& e) {
            logger()->debug("Decoding {} failed at position {}: {}",
                            table_->root_name(), buffer.position(), e.what());
            throw;
        }
    }

    T decode(std::span<const uint8_t> bytes) const {
        ReadBuffer buffer(bytes);
        return decode(buffer);
    }

    // Upper bound of encode(value); never less than the bytes written
    size_t max_encoded_size(const T& value) const {
        return codec_.max_size(value);
    }

    // ARRAY, RECORD, varint(count), values...
    size_t encode_many(WriteBuffer& buffer, std::span<const T> values) const {
        size_t start = buffer.position();
        wire::write_array_header(buffer, Marker::Record, values.size());
        for (const auto& v : values) {
            codec_.write(buffer, v);
        }
        return buffer.position() - start;
    }

    std::vector<T> decode_many(ReadBuffer& buffer) const {
        try {
            uint32_t count = wire::read_array_header(buffer, Marker::Record, "batch");
            std::vector<T> out;
            out.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                out.push_back(codec_.read(buffer));
            }
            return out;
        } catch (const Error& e) {
            logger()->debug("Decoding batch of {} failed at position {}: {}",
                            table_->root_name(), buffer.position(), e.what());
            throw;
        }
    }

    size_t max_encoded_size(std::span<const T> values) const {
        size_t size = MARKER_BYTES + MARKER_BYTES + MAX_VARINT32_BYTES;
        for (const auto& v : values) {
            size += codec_.max_size(v);
        }
        return size;
    }

    template <user_type U>
    uint32_t ordinal_of() const { return table_->ordinal_of(typeid(U)); }

    const std::string& type_at(uint32_t ordinal) const { return table_->type_at(ordinal); }

    const TypeTable& table() const { return *table_; }
    const Config& config() const { return table_->config(); }
    Compatibility compatibility() const { return table_->compatibility(); }

private:
    std::shared_ptr<const TypeTable> table_;
    Codec<T> codec_;
};

} // namespace pickler
