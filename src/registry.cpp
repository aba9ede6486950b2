#include "pickler/registry.hpp"
#include "pickler/compatibility.hpp"
#include "pickler/errors.hpp"
#include "pickler/inspect.hpp"
#include "pickler/interning.hpp"
#include "pickler/log.hpp"
#include "pickler/varint.hpp"
#include "pickler/wire.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace pickler {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;
constexpr char SIGNATURE_SEPARATOR = '!';

uint64_t fnv1a(uint64_t hash, std::string_view text) {
    for (char c : text) {
        hash ^= static_cast<uint8_t>(c);
        hash *= FNV_PRIME;
    }
    return hash;
}

const char* category_name(TypeCategory category) {
    return category == TypeCategory::Record ? "record" : "enum";
}

} // anonymous namespace

std::string_view simple_name(std::string_view qualified) {
    size_t dot = qualified.rfind('.');
    size_t colons = qualified.rfind("::");
    size_t start = 0;
    if (dot != std::string_view::npos) {
        start = dot + 1;
    }
    if (colons != std::string_view::npos && colons + 2 > start) {
        start = colons + 2;
    }
    return qualified.substr(start);
}

uint64_t compute_signature(const TypeEntry& entry) {
    uint64_t hash = fnv1a(FNV_OFFSET_BASIS, simple_name(entry.name));
    const std::string_view separator(&SIGNATURE_SEPARATOR, 1);

    if (entry.category == TypeCategory::Enum) {
        for (const auto& constant : entry.constants) {
            hash = fnv1a(hash, separator);
            hash = fnv1a(hash, constant);
        }
        return hash;
    }
    for (const auto& field : entry.fields) {
        hash = fnv1a(hash, separator);
        hash = fnv1a(hash, field.type.to_tree_string());
        hash = fnv1a(hash, separator);
        hash = fnv1a(hash, field.name);
    }
    return hash;
}

// TypeTable implementation

TypeTable::TypeTable(std::string root_name, Config config)
    : root_name_(std::move(root_name)), config_(config) {}

bool TypeTable::add_type(std::string name, std::type_index type, TypeCategory category) {
    if (sealed_) {
        throw ConfigurationError("TypeTable: add_type() after ordinals were assigned");
    }
    for (const auto& e : entries_) {
        if (e.type == type) {
            return false;
        }
    }
    entries_.emplace_back(std::move(name), type, category);
    return true;
}

void TypeTable::assign_ordinals() {
    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const TypeEntry& a, const TypeEntry& b) { return a.name < b.name; });

    for (uint32_t ordinal = 0; ordinal < entries_.size(); ++ordinal) {
        const TypeEntry& e = entries_[ordinal];
        if (ordinal > 0 && entries_[ordinal - 1].name == e.name) {
            throw ConfigurationError(fmt::format(
                "Type name '{}' is registered by two different types reachable from {}",
                e.name, root_name_));
        }
        by_type_.emplace(e.type, ordinal);
        by_name_.emplace(e.name, ordinal);
        logger()->debug("{}: ordinal {} -> {} ({})", root_name_, ordinal, e.name,
                        category_name(e.category));
    }
    sealed_ = true;
}

TypeEntry& TypeTable::entry_at(uint32_t ordinal) {
    if (ordinal >= entries_.size()) {
        throw ConfigurationError(fmt::format("TypeTable: no ordinal {}", ordinal));
    }
    return entries_[ordinal];
}

void TypeTable::finish() {
    for (auto& e : entries_) {
        e.signature = compute_signature(e);
        if (e.category == TypeCategory::Record) {
            logger()->debug("{}: {} fields [{}] signature {:016x}", e.name, e.fields.size(),
                            [&] {
                                std::string chain;
                                for (const auto& f : e.fields) {
                                    if (!chain.empty()) chain += ", ";
                                    chain += f.name + ": " + f.type.to_tree_string();
                                }
                                return chain;
                            }(),
                            e.signature);
        }
    }

    logger()->info("Built type table for {} with {} types", root_name_, entries_.size());
    if (config_.compatibility != Compatibility::None) {
        logger()->warn("Compatibility mode {} is active for {}; field-count mismatches "
                       "between writer and reader will be tolerated",
                       compatibility_name(config_.compatibility), root_name_);
    }
}

uint32_t TypeTable::ordinal_of(std::type_index type) const {
    auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        throw EncodeError(fmt::format("Type {} is not reachable from {}",
                                      type.name(), root_name_));
    }
    return it->second;
}

std::optional<uint32_t> TypeTable::find_ordinal(std::string_view name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& TypeTable::type_at(uint32_t ordinal) const {
    return entry(ordinal).name;
}

const TypeEntry& TypeTable::entry(uint32_t ordinal) const {
    if (ordinal >= entries_.size()) {
        throw DecodeError(fmt::format("Unknown ordinal {} (table of {} has {} types)",
                                      ordinal, root_name_, entries_.size()));
    }
    return entries_[ordinal];
}

std::optional<uint32_t> TypeTable::find_enum(uint64_t signature) const {
    for (uint32_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].category == TypeCategory::Enum && entries_[i].signature == signature) {
            return i;
        }
    }
    return std::nullopt;
}

uint64_t TypeTable::signature(uint32_t ordinal) const {
    return entry(ordinal).signature;
}

// Encoding

void TypeTable::write_fields(WriteBuffer& buffer, const TypeEntry& e, const void* value) const {
    wire::write_count(buffer, e.fields.size());
    for (const auto& field : e.fields) {
        field.write(buffer, value);
    }
}

void TypeTable::write_record(WriteBuffer& buffer, uint32_t ordinal, const void* value) const {
    const TypeEntry& e = entries_[ordinal];
    DepthGuard guard(buffer.depth_counter(), config_.max_depth);

    buffer.put_marker(Marker::Record);
    varint::encode(buffer, static_cast<int32_t>(ordinal + 1));
    intern_or_reference(buffer, e.name);
    write_fields(buffer, e, value);
}

void TypeTable::write_same_type(WriteBuffer& buffer, uint32_t ordinal, const void* value) const {
    const TypeEntry& e = entries_[ordinal];
    DepthGuard guard(buffer.depth_counter(), config_.max_depth);

    buffer.put_marker(Marker::SameType);
    write_fields(buffer, e, value);
}

void TypeTable::write_enum(WriteBuffer& buffer, uint32_t ordinal, uint32_t index) const {
    const TypeEntry& e = entries_[ordinal];
    buffer.put_marker(Marker::Enum);
    varint::encode(buffer, static_cast<int32_t>(ordinal + 1));
    buffer.put_i64(static_cast<int64_t>(e.signature));
    varint::encode(buffer, static_cast<int32_t>(index));
}

size_t TypeTable::max_record_size(uint32_t ordinal, const void* value) const {
    const TypeEntry& e = entries_[ordinal];
    size_t size = MARKER_BYTES + MAX_VARINT32_BYTES + max_interned_size(e.name) +
                  MAX_VARINT32_BYTES;
    for (const auto& field : e.fields) {
        size += field.max_size(value);
    }
    return size;
}

size_t TypeTable::max_same_type_size(uint32_t ordinal, const void* value) const {
    const TypeEntry& e = entries_[ordinal];
    size_t size = MARKER_BYTES + MAX_VARINT32_BYTES;
    for (const auto& field : e.fields) {
        size += field.max_size(value);
    }
    return size;
}

size_t TypeTable::max_enum_size() {
    return MARKER_BYTES + MAX_VARINT32_BYTES + SIGNATURE_BYTES + MAX_VARINT32_BYTES;
}

// Decoding

void TypeTable::require_category(uint32_t ordinal, TypeCategory expected, size_t at) const {
    const TypeEntry& e = entries_[ordinal];
    if (e.category != expected) {
        throw DecodeError(fmt::format("Ordinal {} at position {} is {} {}, not a {}",
                                      ordinal, at, category_name(e.category), e.name,
                                      category_name(expected)));
    }
}

std::any TypeTable::read_fields(ReadBuffer& buffer, const TypeEntry& e, uint32_t encoded) const {
    auto declared = static_cast<uint32_t>(e.fields.size());
    validate(config_.compatibility, e.name, declared, encoded);

    DepthGuard guard(buffer.depth_counter(), config_.max_depth);

    std::vector<std::any> values;
    values.reserve(std::min(declared, encoded));
    for (uint32_t i = 0; i < declared && i < encoded; ++i) {
        values.push_back(e.fields[i].read(buffer));
    }
    for (uint32_t i = declared; i < encoded; ++i) {
        skip_value(buffer, config_.max_depth);
    }

    if (encoded < declared) {
        auto it = e.fallbacks.find(encoded);
        if (it == e.fallbacks.end()) {
            throw SchemaEvolutionError(fmt::format(
                "{}: no fallback factory for arity {} (declared {} fields) under "
                "compatibility mode {}",
                e.name, encoded, declared, compatibility_name(config_.compatibility)));
        }
        return it->second(std::move(values));
    }
    return e.construct(std::move(values));
}

UserValue TypeTable::read_user_value(ReadBuffer& buffer) const {
    size_t at = buffer.position();
    int32_t marker = buffer.get_marker();

    if (marker == static_cast<int32_t>(Marker::Record)) {
        int32_t wire_ordinal = varint::decode32(buffer);
        std::string name = read_interned_name(buffer);
        uint32_t ordinal = wire_ordinal > 0 ? static_cast<uint32_t>(wire_ordinal) - 1 : UINT32_MAX;
        if (ordinal >= entries_.size() || name != entries_[ordinal].name) {
            // Writer and reader tables differ; the name decides
            auto resolved = find_ordinal(name);
            if (!resolved) {
                throw DecodeError(fmt::format(
                    "Record at position {} has ordinal {} and names type '{}' which {} does not know",
                    at, static_cast<int64_t>(wire_ordinal) - 1, name, root_name_));
            }
            ordinal = *resolved;
        }
        require_category(ordinal, TypeCategory::Record, at);
        uint32_t encoded = wire::read_count(buffer, "field", 0);
        return {ordinal, read_fields(buffer, entries_[ordinal], encoded)};
    }

    if (marker == static_cast<int32_t>(Marker::Enum)) {
        int32_t wire_ordinal = varint::decode32(buffer);
        auto signature = static_cast<uint64_t>(buffer.get_i64());
        uint32_t ordinal = wire_ordinal > 0 ? static_cast<uint32_t>(wire_ordinal) - 1 : UINT32_MAX;
        bool known = ordinal < entries_.size();
        if (!known || entries_[ordinal].category != TypeCategory::Enum ||
            entries_[ordinal].signature != signature) {
            // Writer and reader tables differ; the signature decides
            auto resolved = find_enum(signature);
            if (!resolved) {
                if (known && entries_[ordinal].category == TypeCategory::Enum) {
                    const TypeEntry& e = entries_[ordinal];
                    throw SchemaEvolutionError(fmt::format(
                        "{}: enum signature {:016x} does not match {:016x} under compatibility mode {}",
                        e.name, signature, e.signature, compatibility_name(config_.compatibility)));
                }
                throw DecodeError(fmt::format(
                    "Unknown ordinal {} at position {}: no enum in {} has signature {:016x}",
                    static_cast<int64_t>(wire_ordinal) - 1, at, root_name_, signature));
            }
            ordinal = *resolved;
        }
        const TypeEntry& e = entries_[ordinal];
        size_t index_at = buffer.position();
        int32_t index = varint::decode32(buffer);
        if (index < 0 || static_cast<size_t>(index) >= e.constants.size()) {
            throw DecodeError(fmt::format("Constant index {} at position {} is out of range for {} ({} constants)",
                                          index, index_at, e.name, e.constants.size()));
        }
        return {ordinal, e.constant_at(static_cast<uint32_t>(index))};
    }

    throw DecodeError(fmt::format("Expected RECORD or ENUM marker at position {} but found {}",
                                  at, marker_name(static_cast<Marker>(marker))));
}

std::any TypeTable::read_same_type(ReadBuffer& buffer, uint32_t ordinal) const {
    uint32_t encoded = wire::read_count(buffer, "field", 0);
    return read_fields(buffer, entry(ordinal), encoded);
}

void TypeTable::expect_ordinal(uint32_t expected, uint32_t found) const {
    if (expected != found) {
        throw DecodeError(fmt::format("Expected a value of type {} but found {}",
                                      type_at(expected), type_at(found)));
    }
}

} // namespace pickler
