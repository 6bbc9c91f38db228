#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sharpmap {

enum ModifierFlag : uint32_t {
    MOD_NONE      = 0,
    MOD_PUBLIC    = 1 << 0,
    MOD_INTERNAL  = 1 << 1,
    MOD_PRIVATE   = 1 << 2,
    MOD_PROTECTED = 1 << 3,
    MOD_STATIC    = 1 << 4,
    MOD_ABSTRACT  = 1 << 5,
    MOD_PARTIAL   = 1 << 6,
    MOD_SEALED    = 1 << 7,
    MOD_VIRTUAL   = 1 << 8,
    MOD_OVERRIDE  = 1 << 9,
    MOD_READONLY  = 1 << 10,
    MOD_ASYNC     = 1 << 11,
    MOD_CONST     = 1 << 12,
    MOD_EXTERN    = 1 << 13,
    MOD_NEW       = 1 << 14,
    MOD_UNSAFE    = 1 << 15,
    MOD_VOLATILE  = 1 << 16,
    MOD_REQUIRED  = 1 << 17,
    MOD_FILE      = 1 << 18,
    MOD_REF       = 1 << 19
};

// Returns MOD_NONE when the word is not a modifier keyword.
uint32_t modifier_from_keyword(const std::string& word);
std::vector<std::string> modifier_names(uint32_t modifiers);

enum class TypeKind { Class, Interface, Enum, Record, Struct };

enum class ElementKind { DTO, Service, Controller, Interface, Enum, GenericClass };

enum class MemberKind { Method, Constructor, Property, Field, Event, EnumValue, Delegate };

const char* type_kind_name(TypeKind kind);
const char* element_kind_name(ElementKind kind);
const char* member_kind_name(MemberKind kind);

// Accepts the element names used by the tool layer ("dto", "service",
// "controller", "interface", "enum", "generic_class" or "class"),
// case-insensitively.
std::optional<ElementKind> parse_element_kind(const std::string& text);

const std::vector<ElementKind>& all_element_kinds();

struct SourceSpan {
    int start_line = 0;
    int end_line = 0;

    bool contains(int line) const { return line >= start_line && line <= end_line; }
};

struct Parameter {
    std::string type;
    std::string name;
};

struct Member {
    std::string name;
    MemberKind kind = MemberKind::Field;
    uint32_t modifiers = MOD_NONE;
    std::string signature;
    std::string return_type;
    std::vector<Parameter> parameters;
    int line = 0;
    bool has_body = false;
    bool has_nontrivial_body = false;
    bool has_getter = false;
    bool has_setter = false;
    std::optional<std::string> summary;

    bool is_async() const { return (modifiers & MOD_ASYNC) != 0; }
    nlohmann::json to_json() const;
};

struct TypeDeclaration {
    std::string name;
    TypeKind kind = TypeKind::Class;
    uint32_t modifiers = MOD_NONE;
    std::vector<Member> members;
    std::optional<std::string> summary;
    SourceSpan span;
    std::string containing_file;

    std::string namespace_name;
    std::string containing_type;
    std::vector<std::string> base_types;
    std::vector<std::string> generic_parameters;
    ElementKind element_kind = ElementKind::GenericClass;

    std::size_t count_members(MemberKind kind) const;
    nlohmann::json to_json(bool include_members = true) const;
};

// A recovered-from-error range. Never fatal.
struct ParseWarning {
    int start_line = 0;
    int end_line = 0;
    std::string message;

    nlohmann::json to_json() const;
};

struct FileMetrics {
    int total_lines = 0;
    int code_lines = 0;
    int comment_lines = 0;
    int blank_lines = 0;
    bool has_xml_docs = false;
    int branch_points = 0;

    std::string complexity() const;
    nlohmann::json to_json() const;
};

struct StructuralDocument {
    std::optional<std::string> namespace_name;
    std::vector<TypeDeclaration> declarations;
    std::set<std::string> imports;
    std::vector<ParseWarning> warnings;
    FileMetrics metrics;

    nlohmann::json to_json() const;
};

} // namespace sharpmap
