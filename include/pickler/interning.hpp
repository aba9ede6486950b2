#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pickler {

class WriteBuffer;
class ReadBuffer;

// A type name that is written at most once per buffer
struct InternedName {
    std::string value;
};

// Where an interned name was first written (position of its marker)
struct InternedPosition {
    size_t position;
};

// Distance from a reference marker back to the InternedPosition; always negative
struct InternedOffset {
    int32_t offset;
};

// Per-buffer map of names already written. Created with the buffer and
// discarded by WriteBuffer::flip().
class InterningSession {
public:
    std::optional<InternedPosition> find(std::string_view name) const;
    void record(const InternedName& name, InternedPosition position);

    void count_reference() { ++references_written_; }

    uint32_t names_written() const { return static_cast<uint32_t>(positions_.size()); }
    uint32_t references_written() const { return references_written_; }

private:
    std::map<std::string, size_t, std::less<>> positions_;
    uint32_t references_written_ = 0;
};

// Write `name` in full on first use in this buffer, as a back-reference after
void intern_or_reference(WriteBuffer& buffer, std::string_view name);

// Upper bound of intern_or_reference() for `name`
size_t max_interned_size(std::string_view name);

// Read a full name or resolve a back-reference, leaving the cursor after it
std::string read_interned_name(ReadBuffer& buffer);

// Skip over a full name or a back-reference without resolving it
void skip_interned_name(ReadBuffer& buffer);

} // namespace pickler
