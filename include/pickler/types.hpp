#pragma once

#include <cstdint>
#include <string_view>

namespace pickler {

// Wire markers. Written as zig-zag varints; every value fits in one byte.
enum class Marker : int32_t {
    Null = 0,
    Boolean = -1,
    Byte = -2,
    Short = -3,
    Char = -4,
    Int32 = -5,
    Int32Var = -6,
    Int64 = -7,
    Int64Var = -8,
    Float32 = -9,
    Float64 = -10,
    String = -11,
    OptionalEmpty = -12,
    OptionalPresent = -13,
    InternedName = -14,
    InternedOffset = -15,
    InternedOffsetVar = -16,
    Enum = -17,
    Array = -18,
    Map = -19,
    List = -20,
    Record = -21,
    SameType = -22,
    Uuid = -23
};

constexpr int32_t MARKER_MIN = static_cast<int32_t>(Marker::Uuid);

constexpr bool is_marker(int32_t value) {
    return value <= 0 && value >= MARKER_MIN;
}

std::string_view marker_name(Marker m);

// Leaf classification used by TypeExpr value nodes
enum class ValueKind : uint8_t {
    Bool,
    Byte,
    Short,
    Char,
    Int32,
    Int64,
    Float32,
    Float64,
    String,
    Uuid,
    Enum,
    Structured,
    ClosedVariant
};

std::string_view value_kind_name(ValueKind k);

// Schema evolution policy
enum class Compatibility : uint8_t {
    None = 0,       // field counts must match
    Backwards = 1,  // reader may see fewer fields than it declares
    Forwards = 2,   // reader may see more fields than it declares
    All = 3
};

std::string_view compatibility_name(Compatibility c);

// Category of a concrete type held in the ordinal table
enum class TypeCategory : uint8_t {
    Record = 0,
    Enum = 1
};

// Fixed-width sizes on the wire
constexpr uint32_t SIGNATURE_BYTES = 8;
constexpr uint32_t UUID_BYTES = 16;
constexpr uint32_t MARKER_BYTES = 1;
constexpr uint32_t MAX_VARINT32_BYTES = 5;
constexpr uint32_t MAX_VARINT64_BYTES = 9;

constexpr uint32_t DEFAULT_MAX_DEPTH = 512;

// Array width heuristic. Tunable; changing them changes the bytes written but
// never what a reader accepts.
constexpr uint32_t ARRAY_SAMPLE_SIZE = 32;
constexpr uint32_t SMALL_ARRAY_MIN_SAVING = 1;  // bytes/element, length <= sample
constexpr uint32_t LARGE_ARRAY_MIN_SAVING = 2;  // bytes/element, length > sample

// Environment variables read by Config::from_environment()
constexpr const char* COMPATIBILITY_ENV = "PICKLER_COMPATIBILITY";
constexpr const char* MAX_DEPTH_ENV = "PICKLER_MAX_DEPTH";
constexpr const char* LOG_LEVEL_ENV = "PICKLER_LOG_LEVEL";

// 128-bit identifier, written as two big-endian 64-bit halves
struct Uuid {
    uint64_t high = 0;
    uint64_t low = 0;

    friend bool operator==(const Uuid&, const Uuid&) = default;
};

// Configuration
struct Config {
    Compatibility compatibility = Compatibility::None;
    uint32_t max_depth = DEFAULT_MAX_DEPTH;

    // Resolve from PICKLER_COMPATIBILITY / PICKLER_MAX_DEPTH
    static Config from_environment();
};

} // namespace pickler
