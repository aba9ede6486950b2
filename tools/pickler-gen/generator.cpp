#include "generator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

namespace pickler::gen {

namespace {

constexpr std::string_view RECORD_ATTRIBUTE = "pickler::record";
constexpr std::string_view ENUM_ATTRIBUTE = "pickler::enumeration";

// How far before a declaration to look for its attribute
constexpr size_t ATTRIBUTE_LOOKBEHIND = 200;

std::string take_string(CXString s) {
    const char* c = clang_getCString(s);
    std::string out = c ? c : "";
    clang_disposeString(s);
    return out;
}

bool is_scope(CXCursorKind kind) {
    return kind == CXCursor_Namespace || kind == CXCursor_StructDecl ||
           kind == CXCursor_ClassDecl;
}

// Enclosing namespaces and classes, outermost first, ending with the cursor itself
std::vector<std::string> scope_chain(CXCursor cursor) {
    std::vector<std::string> chain;
    chain.push_back(take_string(clang_getCursorSpelling(cursor)));
    CXCursor parent = clang_getCursorSemanticParent(cursor);
    while (!clang_Cursor_isNull(parent) && is_scope(clang_getCursorKind(parent))) {
        std::string name = take_string(clang_getCursorSpelling(parent));
        if (!name.empty()) {
            chain.insert(chain.begin(), std::move(name));
        }
        parent = clang_getCursorSemanticParent(parent);
    }
    return chain;
}

std::string collapse_spaces(std::string_view text) {
    std::string out;
    for (char c : text) {
        if (c != ' ' && c != '\t') out += c;
    }
    return out;
}

} // anonymous namespace

std::string qualified_cpp_name(CXCursor cursor) {
    std::string out;
    for (const auto& part : scope_chain(cursor)) {
        out += "::" + part;
    }
    return out;
}

std::string dotted_name(CXCursor cursor) {
    std::string out;
    for (const auto& part : scope_chain(cursor)) {
        if (!out.empty()) out += '.';
        out += part;
    }
    return out;
}

Generator::Generator() {
    index_ = clang_createIndex(0, 0);
}

Generator::~Generator() {
    if (index_) {
        clang_disposeIndex(index_);
    }
}

bool Generator::parse(const std::string& filename, const std::vector<std::string>& args) {
    std::vector<const char*> c_args;
    c_args.push_back("-x");
    c_args.push_back("c++");
    c_args.push_back("-std=c++20");
    c_args.push_back("-fparse-all-comments");
    for (const auto& arg : args) {
        c_args.push_back(arg.c_str());
    }

    CXTranslationUnit tu = clang_parseTranslationUnit(
        index_,
        filename.c_str(),
        c_args.data(),
        static_cast<int>(c_args.size()),
        nullptr,
        0,
        CXTranslationUnit_DetailedPreprocessingRecord |
        CXTranslationUnit_SkipFunctionBodies
    );

    if (!tu) {
        std::cerr << "Failed to parse " << filename << "\n";
        return false;
    }

    unsigned num_diags = clang_getNumDiagnostics(tu);
    bool has_errors = false;
    for (unsigned i = 0; i < num_diags; ++i) {
        CXDiagnostic diag = clang_getDiagnostic(tu, i);
        if (clang_getDiagnosticSeverity(diag) >= CXDiagnostic_Error) {
            has_errors = true;
            std::cerr << take_string(clang_formatDiagnostic(diag, CXDiagnostic_DisplaySourceLocation))
                      << "\n";
        }
        clang_disposeDiagnostic(diag);
    }

    if (has_errors) {
        clang_disposeTranslationUnit(tu);
        return false;
    }

    CXCursor cursor = clang_getTranslationUnitCursor(tu);
    clang_visitChildren(cursor, visit_cursor, this);

    clang_disposeTranslationUnit(tu);
    return true;
}

CXChildVisitResult Generator::visit_cursor(CXCursor cursor, CXCursor, CXClientData data) {
    auto* gen = static_cast<Generator*>(data);
    CXCursorKind kind = clang_getCursorKind(cursor);

    if (!clang_Location_isFromMainFile(clang_getCursorLocation(cursor))) {
        return CXChildVisit_Continue;
    }

    if ((kind == CXCursor_StructDecl || kind == CXCursor_ClassDecl) &&
        clang_isCursorDefinition(cursor) && gen->has_attribute(cursor, RECORD_ATTRIBUTE)) {
        TypeInfo info = gen->extract_record(cursor);
        if (gen->verbose_) {
            std::cout << "Found record: " << info.qualified_name << " as " << info.wire_name << "\n";
        }
        gen->types_.push_back(std::move(info));
    } else if (kind == CXCursor_EnumDecl && clang_isCursorDefinition(cursor) &&
               gen->has_attribute(cursor, ENUM_ATTRIBUTE)) {
        TypeInfo info = gen->extract_enum(cursor);
        if (gen->verbose_) {
            std::cout << "Found enumeration: " << info.qualified_name << " as " << info.wire_name << "\n";
        }
        gen->types_.push_back(std::move(info));
    }

    // Nested declarations live in namespaces and classes
    if (is_scope(kind)) {
        return CXChildVisit_Recurse;
    }
    return CXChildVisit_Continue;
}

const std::string& Generator::source_of(const std::string& path) {
    auto it = sources_.find(path);
    if (it != sources_.end()) {
        return it->second;
    }
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return sources_.emplace(path, content.str()).first->second;
}

bool Generator::has_attribute(CXCursor cursor, std::string_view attribute) {
    // libclang does not expose namespaced C++11 attributes, so look for the
    // attribute in the source text between the keyword and the name.
    CXSourceLocation start = clang_getRangeStart(clang_getCursorExtent(cursor));
    CXSourceLocation name_at = clang_getCursorLocation(cursor);

    CXFile file;
    unsigned line, column, start_offset, name_offset;
    clang_getSpellingLocation(start, &file, &line, &column, &start_offset);
    if (!file) return false;
    clang_getSpellingLocation(name_at, nullptr, nullptr, nullptr, &name_offset);

    const std::string& content = source_of(take_string(clang_getFileName(file)));
    if (content.empty()) return false;

    size_t from = start_offset > ATTRIBUTE_LOOKBEHIND ? start_offset - ATTRIBUTE_LOOKBEHIND : 0;
    size_t to = std::min<size_t>(std::max(name_offset, start_offset) + 1, content.size());
    std::string region = collapse_spaces(std::string_view(content).substr(from, to - from));

    return region.find(fmt::format("[[{}]]", attribute)) != std::string::npos;
}

Meta Generator::parse_comment(CXCursor cursor) {
    Meta meta;
    std::string text = take_string(clang_Cursor_getRawCommentText(cursor));
    if (text.empty()) {
        return meta;
    }

    // @name("wire.Name")
    std::regex name_re(R"--(@name\s*\(\s*"([^"]+)"\s*\))--");
    std::smatch match;
    if (std::regex_search(text, match, name_re)) {
        meta.wire_name = match[1];
    }
    return meta;
}

TypeInfo Generator::extract_record(CXCursor cursor) {
    TypeInfo info;
    info.kind = TypeInfo::Kind::Record;
    info.name = take_string(clang_getCursorSpelling(cursor));
    info.qualified_name = qualified_cpp_name(cursor);
    info.wire_name = dotted_name(cursor);
    if (Meta meta = parse_comment(cursor); !meta.wire_name.empty()) {
        info.wire_name = meta.wire_name;
    }

    struct FieldVisitorData {
        Generator* gen;
        TypeInfo* info;
    };
    FieldVisitorData field_data{this, &info};

    clang_visitChildren(cursor, [](CXCursor c, CXCursor, CXClientData d) {
        auto* data = static_cast<FieldVisitorData*>(d);
        if (clang_getCursorKind(c) == CXCursor_FieldDecl) {
            FieldInfo field;
            field.name = take_string(clang_getCursorSpelling(c));
            field.wire_name = field.name;
            field.type_name = take_string(clang_getTypeSpelling(clang_getCursorType(c)));
            if (Meta meta = data->gen->parse_comment(c); !meta.wire_name.empty()) {
                field.wire_name = meta.wire_name;
            }
            data->info->fields.push_back(std::move(field));
        }
        return CXChildVisit_Continue;
    }, &field_data);

    return info;
}

TypeInfo Generator::extract_enum(CXCursor cursor) {
    TypeInfo info;
    info.kind = TypeInfo::Kind::Enumeration;
    info.name = take_string(clang_getCursorSpelling(cursor));
    info.qualified_name = qualified_cpp_name(cursor);
    info.wire_name = dotted_name(cursor);
    if (Meta meta = parse_comment(cursor); !meta.wire_name.empty()) {
        info.wire_name = meta.wire_name;
    }

    struct ConstantVisitorData {
        Generator* gen;
        TypeInfo* info;
    };
    ConstantVisitorData constant_data{this, &info};

    clang_visitChildren(cursor, [](CXCursor c, CXCursor, CXClientData d) {
        auto* data = static_cast<ConstantVisitorData*>(d);
        if (clang_getCursorKind(c) == CXCursor_EnumConstantDecl) {
            ConstantInfo constant;
            constant.name = take_string(clang_getCursorSpelling(c));
            constant.wire_name = constant.name;
            if (Meta meta = data->gen->parse_comment(c); !meta.wire_name.empty()) {
                constant.wire_name = meta.wire_name;
            }
            data->info->constants.push_back(std::move(constant));
        }
        return CXChildVisit_Continue;
    }, &constant_data);

    return info;
}

std::string Generator::generate_header() const {
    std::ostringstream out;

    out << "// Generated by pickler-gen - DO NOT EDIT\n";
    out << "// Include after the definitions of the types below.\n";
    out << "#pragma once\n\n";
    out << "#include <pickler/descriptor.hpp>\n\n";
    out << "#include <string_view>\n\n";
    out << "namespace pickler {\n\n";

    for (const auto& type : types_) {
        out << fmt::format("// {}: {}\n", type.kind == TypeInfo::Kind::Record ? "Record" : "Enumeration",
                           type.qualified_name);
        out << "template <>\n";
        out << fmt::format("struct Shape<{}> {{\n", type.qualified_name);
        out << fmt::format("    static constexpr std::string_view name = \"{}\";\n", type.wire_name);

        if (type.kind == TypeInfo::Kind::Record) {
            out << "    static auto fields() {\n";
            out << "        return pickler::fields(";
            for (size_t i = 0; i < type.fields.size(); ++i) {
                const auto& field = type.fields[i];
                out << (i == 0 ? "\n" : ",\n");
                out << fmt::format("            pickler::field(\"{}\", &{}::{})",
                                   field.wire_name, type.qualified_name, field.name);
            }
            out << ");\n";
            out << "    }\n";
        } else {
            out << "    static constexpr auto constants() {\n";
            out << "        return pickler::constants(";
            for (size_t i = 0; i < type.constants.size(); ++i) {
                const auto& constant = type.constants[i];
                out << (i == 0 ? "\n" : ",\n");
                out << fmt::format("            pickler::constant(\"{}\", {}::{})",
                                   constant.wire_name, type.qualified_name, constant.name);
            }
            out << ");\n";
            out << "    }\n";
        }
        out << "};\n\n";
    }

    out << "} // namespace pickler\n";
    return out.str();
}

} // namespace pickler::gen
