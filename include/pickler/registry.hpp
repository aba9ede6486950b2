#pragma once

#include "buffer.hpp"
#include "type_expr.hpp"
#include "types.hpp"

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace pickler {

// Erased codec for one declared field. `owner` points at the structured
// value that declares the field.
struct FieldEntry {
    std::string name;
    TypeExpr type;
    std::function<void(WriteBuffer&, const void* owner)> write;
    std::function<std::any(ReadBuffer&)> read;
    std::function<size_t(const void* owner)> max_size;
};

using Factory = std::function<std::any(std::vector<std::any>&&)>;

// One concrete type in the ordinal table
struct TypeEntry {
    std::string name;
    std::type_index type;
    TypeCategory category = TypeCategory::Record;
    uint64_t signature = 0;

    // Records
    std::vector<FieldEntry> fields;
    Factory construct;
    std::map<uint32_t, Factory> fallbacks;  // keyed by arity

    // Enums
    std::vector<std::string> constants;
    std::function<std::any(uint32_t)> constant_at;

    TypeEntry(std::string n, std::type_index t, TypeCategory c)
        : name(std::move(n)), type(t), category(c) {}
};

// A decoded structured or enum value together with its ordinal
struct UserValue {
    uint32_t ordinal;
    std::any value;
};

// Ordinal table for every concrete type reachable from one root type.
//
// Built in three steps by the pickler: add_type() for each discovered type,
// assign_ordinals() to sort by name, then entry_at() to attach field chains
// and finish() to compute signatures. Immutable afterwards and safe to share
// between threads.
class TypeTable {
public:
    TypeTable(std::string root_name, Config config);

    TypeTable(const TypeTable&) = delete;
    TypeTable& operator=(const TypeTable&) = delete;

    // Building

    // Returns false if `type` was already added
    bool add_type(std::string name, std::type_index type, TypeCategory category);
    void assign_ordinals();
    TypeEntry& entry_at(uint32_t ordinal);
    void finish();

    // Lookup

    uint32_t ordinal_of(std::type_index type) const;
    std::optional<uint32_t> find_ordinal(std::string_view name) const;
    const std::string& type_at(uint32_t ordinal) const;
    const TypeEntry& entry(uint32_t ordinal) const;
    uint64_t signature(uint32_t ordinal) const;
    size_t size() const { return entries_.size(); }

    const std::string& root_name() const { return root_name_; }
    const Config& config() const { return config_; }
    Compatibility compatibility() const { return config_.compatibility; }

    // Encoding

    // RECORD, varint(ordinal + 1), interned name, varint(field count), fields
    void write_record(WriteBuffer& buffer, uint32_t ordinal, const void* value) const;
    // SAME_TYPE, varint(field count), fields
    void write_same_type(WriteBuffer& buffer, uint32_t ordinal, const void* value) const;
    // ENUM, varint(ordinal + 1), signature, varint(constant index)
    void write_enum(WriteBuffer& buffer, uint32_t ordinal, uint32_t index) const;

    size_t max_record_size(uint32_t ordinal, const void* value) const;
    size_t max_same_type_size(uint32_t ordinal, const void* value) const;
    static size_t max_enum_size();

    // Decoding

    // Read a RECORD or ENUM value of any ordinal in this table
    UserValue read_user_value(ReadBuffer& buffer) const;
    // Read the body of a SAME_TYPE value after its marker
    std::any read_same_type(ReadBuffer& buffer, uint32_t ordinal) const;
    // DecodeError unless a value read for `expected` came back as that type
    void expect_ordinal(uint32_t expected, uint32_t found) const;

private:
    std::string root_name_;
    Config config_;
    std::vector<TypeEntry> entries_;
    std::map<std::type_index, uint32_t> by_type_;
    std::map<std::string, uint32_t, std::less<>> by_name_;
    bool sealed_ = false;

    void write_fields(WriteBuffer& buffer, const TypeEntry& entry, const void* value) const;
    std::any read_fields(ReadBuffer& buffer, const TypeEntry& entry, uint32_t encoded) const;
    std::optional<uint32_t> find_enum(uint64_t signature) const;
    void require_category(uint32_t ordinal, TypeCategory expected, size_t at) const;
};

// 64-bit FNV-1a over the simple name, then each field's tree string and
// name, joined with '!'. Enum entries hash their constant names.
uint64_t compute_signature(const TypeEntry& entry);

// Part of a qualified name after the last '.' or "::"
std::string_view simple_name(std::string_view qualified);

} // namespace pickler
