#pragma once

#include "buffer.hpp"
#include "types.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace pickler {

// Advance past exactly one encoded value of any kind, using only the
// markers on the wire. Nesting deeper than `max_depth` is a DepthExceededError.
void skip_value(ReadBuffer& buffer, uint32_t max_depth = DEFAULT_MAX_DEPTH);

// Render every value in `bytes` as an indented marker tree, one value per
// line, resolving interned names.
std::string inspect(std::span<const uint8_t> bytes, uint32_t max_depth = DEFAULT_MAX_DEPTH);

} // namespace pickler
