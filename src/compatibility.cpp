#include "pickler/compatibility.hpp"
#include "pickler/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace pickler {

Compatibility parse_compatibility(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "NONE") return Compatibility::None;
    if (upper == "BACKWARDS") return Compatibility::Backwards;
    if (upper == "FORWARDS") return Compatibility::Forwards;
    if (upper == "ALL") return Compatibility::All;

    throw ConfigurationError(fmt::format(
        "Unknown compatibility mode '{}' (expected NONE, BACKWARDS, FORWARDS or ALL)", text));
}

void validate(Compatibility mode, std::string_view type_name,
              uint32_t declared, uint32_t encoded) {
    if (encoded == declared) {
        return;
    }
    if (encoded < declared && allows_fewer_fields(mode)) {
        return;
    }
    if (encoded > declared && allows_extra_fields(mode)) {
        return;
    }
    throw SchemaEvolutionError(fmt::format(
        "{}: encoded field count {} does not match declared field count {} "
        "under compatibility mode {}",
        type_name, encoded, declared, compatibility_name(mode)));
}

} // namespace pickler
