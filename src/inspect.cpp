#include "pickler/inspect.hpp"
#include "pickler/errors.hpp"
#include "pickler/interning.hpp"
#include "pickler/varint.hpp"
#include "pickler/wire.hpp"

#include <fmt/format.h>

namespace pickler {

namespace {

// Bytes per element of a packed array, 0 when elements vary in size
size_t packed_width(Marker element) {
    switch (element) {
        case Marker::Short:
        case Marker::Char:
            return 2;
        case Marker::Int32:
        case Marker::Float32:
            return 4;
        case Marker::Int64:
        case Marker::Float64:
            return 8;
        case Marker::Uuid:
            return UUID_BYTES;
        default:
            return 0;
    }
}

// Whether array elements of this marker are written by their own full codec
bool is_self_describing_element(Marker element) {
    switch (element) {
        case Marker::Record:
        case Marker::Enum:
        case Marker::SameType:
        case Marker::Array:
        case Marker::List:
        case Marker::Map:
        case Marker::OptionalPresent:
        case Marker::OptionalEmpty:
        case Marker::Null:
            return true;
        default:
            return false;
    }
}

void skip_array(ReadBuffer& buffer, uint32_t max_depth) {
    auto element = static_cast<Marker>(buffer.get_marker());

    if (element == Marker::Boolean) {
        wire::read_count(buffer, "bool array", 0);
        uint32_t byte_count = wire::read_count(buffer, "bool array bitset");
        buffer.skip(byte_count);
        return;
    }
    if (element == Marker::Byte) {
        buffer.skip(wire::read_count(buffer, "byte array"));
        return;
    }
    if (size_t width = packed_width(element); width > 0) {
        uint32_t length = wire::read_count(buffer, "array", width);
        buffer.skip(static_cast<size_t>(length) * width);
        return;
    }

    uint32_t length = wire::read_count(buffer, "array");
    switch (element) {
        case Marker::Int32Var:
            for (uint32_t i = 0; i < length; ++i) varint::decode32(buffer);
            return;
        case Marker::Int64Var:
            for (uint32_t i = 0; i < length; ++i) varint::decode64(buffer);
            return;
        case Marker::String:
            for (uint32_t i = 0; i < length; ++i) wire::get_string_body(buffer);
            return;
        default:
            break;
    }
    if (!is_self_describing_element(element)) {
        throw DecodeError(fmt::format("Array element marker {} is not valid",
                                      marker_name(element)));
    }
    for (uint32_t i = 0; i < length; ++i) {
        skip_value(buffer, max_depth);
    }
}

// Renders one value into `out` at `indent` levels
class Printer {
public:
    Printer(ReadBuffer& buffer, std::string& out, uint32_t max_depth)
        : buffer_(buffer), out_(out), max_depth_(max_depth) {}

    void value(int indent);

private:
    ReadBuffer& buffer_;
    std::string& out_;
    uint32_t max_depth_;

    void line(int indent, const std::string& text) {
        out_.append(static_cast<size_t>(indent) * 2, ' ');
        out_ += text;
        out_ += '\n';
    }

    void children(int indent, uint32_t count) {
        for (uint32_t i = 0; i < count; ++i) {
            value(indent);
        }
    }

    void array(int indent, size_t at);
};

void Printer::value(int indent) {
    DepthGuard guard(buffer_.depth_counter(), max_depth_);
    size_t at = buffer_.position();
    auto marker = static_cast<Marker>(buffer_.get_marker());
    std::string prefix = fmt::format("@{} {}", at, marker_name(marker));

    switch (marker) {
        case Marker::Null:
        case Marker::OptionalEmpty:
            line(indent, prefix);
            return;
        case Marker::Boolean:
            line(indent, fmt::format("{} {}", prefix, buffer_.get_u8() != 0));
            return;
        case Marker::Byte:
            line(indent, fmt::format("{} {}", prefix, static_cast<int8_t>(buffer_.get_u8())));
            return;
        case Marker::Short:
            line(indent, fmt::format("{} {}", prefix, buffer_.get_i16()));
            return;
        case Marker::Char:
            line(indent, fmt::format("{} U+{:04X}", prefix, static_cast<uint16_t>(buffer_.get_i16())));
            return;
        case Marker::Int32:
            line(indent, fmt::format("{} {}", prefix, buffer_.get_i32()));
            return;
        case Marker::Int32Var:
            line(indent, fmt::format("{} {}", prefix, varint::decode32(buffer_)));
            return;
        case Marker::Int64:
            line(indent, fmt::format("{} {}", prefix, buffer_.get_i64()));
            return;
        case Marker::Int64Var:
            line(indent, fmt::format("{} {}", prefix, varint::decode64(buffer_)));
            return;
        case Marker::Float32:
            line(indent, fmt::format("{} {}", prefix, buffer_.get_f32()));
            return;
        case Marker::Float64:
            line(indent, fmt::format("{} {}", prefix, buffer_.get_f64()));
            return;
        case Marker::String:
            line(indent, fmt::format("{} \"{}\"", prefix, wire::get_string_body(buffer_)));
            return;
        case Marker::Uuid: {
            Uuid id = wire::get_uuid_body(buffer_);
            line(indent, fmt::format("{} {:016x}{:016x}", prefix, id.high, id.low));
            return;
        }
        case Marker::OptionalPresent:
            line(indent, prefix);
            value(indent + 1);
            return;
        case Marker::Enum: {
            int64_t ordinal = static_cast<int64_t>(varint::decode32(buffer_)) - 1;
            auto signature = static_cast<uint64_t>(buffer_.get_i64());
            int32_t index = varint::decode32(buffer_);
            line(indent, fmt::format("{} #{} signature={:016x} index={}",
                                     prefix, ordinal, signature, index));
            return;
        }
        case Marker::Record: {
            int64_t ordinal = static_cast<int64_t>(varint::decode32(buffer_)) - 1;
            std::string name = read_interned_name(buffer_);
            uint32_t count = wire::read_count(buffer_, "field");
            line(indent, fmt::format("{} #{} {} ({} fields)", prefix, ordinal, name, count));
            children(indent + 1, count);
            return;
        }
        case Marker::SameType: {
            uint32_t count = wire::read_count(buffer_, "field");
            line(indent, fmt::format("{} ({} fields)", prefix, count));
            children(indent + 1, count);
            return;
        }
        case Marker::List: {
            uint32_t count = wire::read_count(buffer_, "list");
            line(indent, fmt::format("{} [{}]", prefix, count));
            children(indent + 1, count);
            return;
        }
        case Marker::Map: {
            uint32_t count = wire::read_count(buffer_, "map", 2);
            line(indent, fmt::format("{} {{{}}}", prefix, count));
            children(indent + 1, count * 2);
            return;
        }
        case Marker::Array:
            array(indent, at);
            return;
        case Marker::InternedName:
        case Marker::InternedOffset:
        case Marker::InternedOffsetVar:
            break;
    }
    throw DecodeError(fmt::format("Unexpected {} marker at position {}", marker_name(marker), at));
}

void Printer::array(int indent, size_t at) {
    size_t element_at = buffer_.position();
    auto element = static_cast<Marker>(buffer_.get_marker());
    std::string prefix = fmt::format("@{} ARRAY<{}>", at, marker_name(element));

    if (is_self_describing_element(element)) {
        uint32_t length = wire::read_count(buffer_, "array");
        line(indent, fmt::format("{} [{}]", prefix, length));
        children(indent + 1, length);
        return;
    }

    // Packed arrays: let the typed readers parse, then print the elements
    buffer_.seek(at);
    std::string items;
    auto join = [&items](const auto& values, auto&& render) {
        for (const auto& v : values) {
            if (!items.empty()) items += ", ";
            items += render(v);
        }
        return values.size();
    };
    auto plain = [](const auto& v) { return fmt::format("{}", v); };
    size_t length = 0;

    switch (element) {
        case Marker::Boolean:
            length = join(wire::read_bool_array(buffer_),
                          [](uint8_t v) { return std::string(v ? "true" : "false"); });
            break;
        case Marker::Byte:
            length = join(wire::read_byte_array(buffer_),
                          [](int8_t v) { return fmt::format("{}", static_cast<int>(v)); });
            break;
        case Marker::Short:
            length = join(wire::read_short_array(buffer_), plain);
            break;
        case Marker::Char:
            length = join(wire::read_char_array(buffer_), [](char16_t v) {
                return fmt::format("U+{:04X}", static_cast<uint16_t>(v));
            });
            break;
        case Marker::Int32:
        case Marker::Int32Var:
            length = join(wire::read_int32_array(buffer_), plain);
            break;
        case Marker::Int64:
        case Marker::Int64Var:
            length = join(wire::read_int64_array(buffer_), plain);
            break;
        case Marker::Float32:
            length = join(wire::read_float32_array(buffer_), plain);
            break;
        case Marker::Float64:
            length = join(wire::read_float64_array(buffer_), plain);
            break;
        case Marker::String:
            length = join(wire::read_string_array(buffer_),
                          [](const std::string& v) { return fmt::format("\"{}\"", v); });
            break;
        case Marker::Uuid:
            length = join(wire::read_uuid_array(buffer_), [](const Uuid& v) {
                return fmt::format("{:016x}{:016x}", v.high, v.low);
            });
            break;
        default:
            throw DecodeError(fmt::format("Array element marker {} at position {} is not valid",
                                          marker_name(element), element_at));
    }
    line(indent, fmt::format("{} [{}]: {}", prefix, length, items));
}

} // anonymous namespace

void skip_value(ReadBuffer& buffer, uint32_t max_depth) {
    DepthGuard guard(buffer.depth_counter(), max_depth);
    size_t at = buffer.position();
    auto marker = static_cast<Marker>(buffer.get_marker());

    switch (marker) {
        case Marker::Null:
        case Marker::OptionalEmpty:
            return;
        case Marker::Boolean:
        case Marker::Byte:
            buffer.skip(1);
            return;
        case Marker::Short:
        case Marker::Char:
            buffer.skip(2);
            return;
        case Marker::Int32:
        case Marker::Float32:
            buffer.skip(4);
            return;
        case Marker::Int64:
        case Marker::Float64:
            buffer.skip(8);
            return;
        case Marker::Int32Var:
            varint::decode32(buffer);
            return;
        case Marker::Int64Var:
            varint::decode64(buffer);
            return;
        case Marker::String:
            wire::get_string_body(buffer);
            return;
        case Marker::Uuid:
            buffer.skip(UUID_BYTES);
            return;
        case Marker::OptionalPresent:
            skip_value(buffer, max_depth);
            return;
        case Marker::Enum:
            varint::decode32(buffer);
            buffer.skip(SIGNATURE_BYTES);
            varint::decode32(buffer);
            return;
        case Marker::Record: {
            varint::decode32(buffer);
            skip_interned_name(buffer);
            uint32_t count = wire::read_count(buffer, "field");
            for (uint32_t i = 0; i < count; ++i) skip_value(buffer, max_depth);
            return;
        }
        case Marker::SameType:
        case Marker::List: {
            uint32_t count = wire::read_count(buffer, marker_name(marker));
            for (uint32_t i = 0; i < count; ++i) skip_value(buffer, max_depth);
            return;
        }
        case Marker::Map: {
            uint32_t count = wire::read_count(buffer, "map", 2);
            for (uint32_t i = 0; i < count; ++i) {
                skip_value(buffer, max_depth);
                skip_value(buffer, max_depth);
            }
            return;
        }
        case Marker::Array:
            skip_array(buffer, max_depth);
            return;
        case Marker::InternedName:
        case Marker::InternedOffset:
        case Marker::InternedOffsetVar:
            break;
    }
    throw DecodeError(fmt::format("Unexpected {} marker at position {}", marker_name(marker), at));
}

std::string inspect(std::span<const uint8_t> bytes, uint32_t max_depth) {
    ReadBuffer buffer(bytes);
    std::string out;
    Printer printer(buffer, out, max_depth);
    while (buffer.has_remaining()) {
        printer.value(0);
    }
    return out;
}

} // namespace pickler
