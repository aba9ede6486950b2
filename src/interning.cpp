#include "pickler/interning.hpp"
#include "pickler/buffer.hpp"
#include "pickler/errors.hpp"
#include "pickler/varint.hpp"

#include <fmt/format.h>

#include <limits>

namespace pickler {

namespace {

// Offsets whose varint needs this many bytes or more use the fixed int32 form
constexpr uint32_t FIXED_OFFSET_THRESHOLD = 4;

std::string read_name_body(ReadBuffer& buffer) {
    size_t at = buffer.position();
    int32_t length = varint::decode32(buffer);
    if (length < 0 || static_cast<size_t>(length) > buffer.remaining()) {
        throw DecodeError(fmt::format(
            "Interned name at position {} has invalid length {}", at, length));
    }
    return buffer.get_string(static_cast<size_t>(length));
}

// Reads the offset following an offset marker
int32_t read_offset(ReadBuffer& buffer, int32_t marker) {
    if (marker == static_cast<int32_t>(Marker::InternedOffsetVar)) {
        return varint::decode32(buffer);
    }
    return buffer.get_i32();
}

bool is_reference_marker(int32_t marker) {
    return marker == static_cast<int32_t>(Marker::InternedOffsetVar) ||
           marker == static_cast<int32_t>(Marker::InternedOffset);
}

} // anonymous namespace

// InterningSession implementation

std::optional<InternedPosition> InterningSession::find(std::string_view name) const {
    auto it = positions_.find(name);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return InternedPosition{it->second};
}

void InterningSession::record(const InternedName& name, InternedPosition position) {
    positions_.emplace(name.value, position.position);
}

// Free functions

void intern_or_reference(WriteBuffer& buffer, std::string_view name) {
    InterningSession& session = buffer.interning();
    size_t current = buffer.position();

    if (auto recorded = session.find(name)) {
        size_t distance = current - recorded->position;
        if (distance > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
            throw EncodeError(fmt::format(
                "Interned name '{}' is {} bytes back, beyond the reach of an offset",
                name, distance));
        }
        InternedOffset offset{-static_cast<int32_t>(distance)};
        if (varint::size_of(offset.offset) < FIXED_OFFSET_THRESHOLD) {
            buffer.put_marker(Marker::InternedOffsetVar);
            varint::encode(buffer, offset.offset);
        } else {
            buffer.put_marker(Marker::InternedOffset);
            buffer.put_i32(offset.offset);
        }
        session.count_reference();
        return;
    }

    if (name.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw EncodeError("Type name too long to intern");
    }
    buffer.put_marker(Marker::InternedName);
    varint::encode(buffer, static_cast<int32_t>(name.size()));
    buffer.put_bytes(name.data(), name.size());
    session.record(InternedName{std::string(name)}, InternedPosition{current});
}

size_t max_interned_size(std::string_view name) {
    return MARKER_BYTES + MAX_VARINT32_BYTES + name.size();
}

std::string read_interned_name(ReadBuffer& buffer) {
    size_t current = buffer.position();
    int32_t marker = buffer.get_marker();

    if (marker == static_cast<int32_t>(Marker::InternedName)) {
        return read_name_body(buffer);
    }
    if (!is_reference_marker(marker)) {
        throw DecodeError(fmt::format(
            "Expected an interned name at position {} but found {}",
            current, marker_name(static_cast<Marker>(marker))));
    }

    InternedOffset offset{read_offset(buffer, marker)};
    if (offset.offset >= 0 ||
        static_cast<size_t>(-static_cast<int64_t>(offset.offset)) > current) {
        throw DecodeError(fmt::format(
            "Interned offset {} at position {} does not point back into the buffer",
            offset.offset, current));
    }

    size_t resume = buffer.position();
    buffer.seek(current - static_cast<size_t>(-static_cast<int64_t>(offset.offset)));
    buffer.expect_marker(Marker::InternedName, "interned reference target");
    std::string name = read_name_body(buffer);
    buffer.seek(resume);
    return name;
}

void skip_interned_name(ReadBuffer& buffer) {
    size_t current = buffer.position();
    int32_t marker = buffer.get_marker();

    if (marker == static_cast<int32_t>(Marker::InternedName)) {
        int32_t length = varint::decode32(buffer);
        if (length < 0) {
            throw DecodeError(fmt::format(
                "Interned name at position {} has negative length", current));
        }
        buffer.skip(static_cast<size_t>(length));
        return;
    }
    if (!is_reference_marker(marker)) {
        throw DecodeError(fmt::format(
            "Expected an interned name at position {} but found {}",
            current, marker_name(static_cast<Marker>(marker))));
    }
    read_offset(buffer, marker);
}

} // namespace pickler
