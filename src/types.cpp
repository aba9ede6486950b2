#include "pickler/types.hpp"

namespace pickler {

std::string_view marker_name(Marker m) {
    switch (m) {
        case Marker::Null: return "NULL";
        case Marker::Boolean: return "BOOLEAN";
        case Marker::Byte: return "BYTE";
        case Marker::Short: return "SHORT";
        case Marker::Char: return "CHAR";
        case Marker::Int32: return "INT32";
        case Marker::Int32Var: return "INT32_VAR";
        case Marker::Int64: return "INT64";
        case Marker::Int64Var: return "INT64_VAR";
        case Marker::Float32: return "FLOAT32";
        case Marker::Float64: return "FLOAT64";
        case Marker::String: return "STRING";
        case Marker::OptionalEmpty: return "OPTIONAL_EMPTY";
        case Marker::OptionalPresent: return "OPTIONAL_PRESENT";
        case Marker::InternedName: return "INTERNED_NAME";
        case Marker::InternedOffset: return "INTERNED_OFFSET";
        case Marker::InternedOffsetVar: return "INTERNED_OFFSET_VAR";
        case Marker::Enum: return "ENUM";
        case Marker::Array: return "ARRAY";
        case Marker::Map: return "MAP";
        case Marker::List: return "LIST";
        case Marker::Record: return "RECORD";
        case Marker::SameType: return "SAME_TYPE";
        case Marker::Uuid: return "UUID";
    }
    return "UNKNOWN";
}

std::string_view value_kind_name(ValueKind k) {
    switch (k) {
        case ValueKind::Bool: return "bool";
        case ValueKind::Byte: return "byte";
        case ValueKind::Short: return "short";
        case ValueKind::Char: return "char";
        case ValueKind::Int32: return "int32";
        case ValueKind::Int64: return "int64";
        case ValueKind::Float32: return "float32";
        case ValueKind::Float64: return "float64";
        case ValueKind::String: return "string";
        case ValueKind::Uuid: return "uuid";
        case ValueKind::Enum: return "enum";
        case ValueKind::Structured: return "structured";
        case ValueKind::ClosedVariant: return "variant";
    }
    return "unknown";
}

std::string_view compatibility_name(Compatibility c) {
    switch (c) {
        case Compatibility::None: return "NONE";
        case Compatibility::Backwards: return "BACKWARDS";
        case Compatibility::Forwards: return "FORWARDS";
        case Compatibility::All: return "ALL";
    }
    return "UNKNOWN";
}

} // namespace pickler
