#pragma once

#include "types.hpp"

#include <cstdint>
#include <string_view>

namespace pickler {

// Parse NONE | BACKWARDS | FORWARDS | ALL (case-insensitive).
// Anything else is a ConfigurationError.
Compatibility parse_compatibility(std::string_view text);

// Check an encoded field count against the declared one. Throws
// SchemaEvolutionError naming the mode and both counts.
void validate(Compatibility mode, std::string_view type_name,
              uint32_t declared, uint32_t encoded);

// Whether `mode` lets a reader fill missing trailing fields from a fallback
constexpr bool allows_fewer_fields(Compatibility mode) {
    return mode == Compatibility::Backwards || mode == Compatibility::All;
}

// Whether `mode` lets a reader skip extra trailing fields
constexpr bool allows_extra_fields(Compatibility mode) {
    return mode == Compatibility::Forwards || mode == Compatibility::All;
}

} // namespace pickler
