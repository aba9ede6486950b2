#pragma once

#include <optional>
#include <string>
#include <variant>

// Stack protocol types for the pickler example.
// Shapes for these are emitted by pickler-gen into stack_types_generated.hpp.
//
// Annotation guide:
//   [[pickler::record]]      - struct encoded field by field, in declaration order
//   [[pickler::enumeration]] - enum encoded by constant index
//   @name("...")             - wire name override for a type, field or constant

namespace stack {

enum class [[pickler::enumeration]] ErrorCode {
    Empty,
    Full
};

// Commands

struct [[pickler::record]] Push {
    std::string item;
};

struct [[pickler::record]] Pop {};

struct [[pickler::record]] Peek {};

using Command = std::variant<Push, Pop, Peek>;

// Responses

struct [[pickler::record]] Success {
    std::optional<std::string> value;
};

/// @name("stack.Error")
struct [[pickler::record]] Failure {
    ErrorCode code;
    std::string reason;
};

using Response = std::variant<Success, Failure>;

} // namespace stack
