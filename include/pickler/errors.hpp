#pragma once

#include <stdexcept>
#include <string>

namespace pickler {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Raised while building a pickler: unsupported field type, open variant
// member, duplicate type name, invalid fallback or environment value.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& msg) : Error(msg) {}
};

// Raised while writing: unknown concrete type, buffer overflow, closed buffer.
class EncodeError : public Error {
public:
    explicit EncodeError(const std::string& msg) : Error(msg) {}
};

// Raised while reading: the buffer is untrustworthy past this point.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& msg) : Error(msg) {}
};

// Field count or signature incompatible with the active Compatibility mode.
class SchemaEvolutionError : public Error {
public:
    explicit SchemaEvolutionError(const std::string& msg) : Error(msg) {}
};

class DepthExceededError : public Error {
public:
    explicit DepthExceededError(const std::string& msg) : Error(msg) {}
};

} // namespace pickler
