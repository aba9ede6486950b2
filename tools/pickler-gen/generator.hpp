#pragma once

#include <clang-c/Index.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pickler::gen {

// Metadata parsed from the comment above a type or field
struct Meta {
    std::string wire_name;  // @name("...")
};

struct FieldInfo {
    std::string name;       // C++ member name
    std::string wire_name;  // name in Shape<T>::fields()
    std::string type_name;
};

struct ConstantInfo {
    std::string name;       // C++ enumerator
    std::string wire_name;
};

struct TypeInfo {
    enum class Kind { Record, Enumeration };

    Kind kind = Kind::Record;
    std::string name;            // unqualified
    std::string qualified_name;  // ::ns::Type
    std::string wire_name;       // ns.Type unless overridden with @name
    std::vector<FieldInfo> fields;
    std::vector<ConstantInfo> constants;
};

// Finds structs marked [[pickler::record]] and enums marked
// [[pickler::enumeration]] and emits pickler::Shape specialisations for them.
class Generator {
public:
    Generator();
    ~Generator();

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    // Parse a source file
    bool parse(const std::string& filename, const std::vector<std::string>& args);

    const std::vector<TypeInfo>& types() const { return types_; }

    std::string generate_header() const;

    void set_verbose(bool v) { verbose_ = v; }

private:
    CXIndex index_ = nullptr;
    std::vector<TypeInfo> types_;
    bool verbose_ = false;
    std::map<std::string, std::string> sources_;  // file contents by path

    static CXChildVisitResult visit_cursor(CXCursor cursor, CXCursor parent, CXClientData data);

    // Whether `attribute` appears just before the declaration at `cursor`
    bool has_attribute(CXCursor cursor, std::string_view attribute);

    const std::string& source_of(const std::string& path);

    TypeInfo extract_record(CXCursor cursor);
    TypeInfo extract_enum(CXCursor cursor);

    Meta parse_comment(CXCursor cursor);
};

// "::a::b::T" and "a.b.T" for the declaration at `cursor`
std::string qualified_cpp_name(CXCursor cursor);
std::string dotted_name(CXCursor cursor);

} // namespace pickler::gen
