#include "pickler/compatibility.hpp"
#include "pickler/errors.hpp"
#include "pickler/types.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace pickler {

namespace {

uint32_t parse_max_depth(std::string_view text) {
    uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value == 0) {
        throw ConfigurationError(fmt::format(
            "{}='{}' is not a positive integer", MAX_DEPTH_ENV, text));
    }
    return value;
}

} // anonymous namespace

Config Config::from_environment() {
    Config config;

    if (const char* mode = std::getenv(COMPATIBILITY_ENV); mode && *mode) {
        config.compatibility = parse_compatibility(mode);
    }
    if (const char* depth = std::getenv(MAX_DEPTH_ENV); depth && *depth) {
        config.max_depth = parse_max_depth(depth);
    }
    return config;
}

} // namespace pickler
