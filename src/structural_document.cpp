#include "structural_document.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace sharpmap {

using json = nlohmann::json;

namespace {

struct ModifierEntry {
    const char* keyword;
    uint32_t flag;
};

// Declaration order is the order modifier_names() reports them in.
const ModifierEntry kModifiers[] = {
    {"public", MOD_PUBLIC},     {"internal", MOD_INTERNAL}, {"private", MOD_PRIVATE},
    {"protected", MOD_PROTECTED}, {"static", MOD_STATIC},   {"abstract", MOD_ABSTRACT},
    {"partial", MOD_PARTIAL},   {"sealed", MOD_SEALED},     {"virtual", MOD_VIRTUAL},
    {"override", MOD_OVERRIDE}, {"readonly", MOD_READONLY}, {"async", MOD_ASYNC},
    {"const", MOD_CONST},       {"extern", MOD_EXTERN},     {"new", MOD_NEW},
    {"unsafe", MOD_UNSAFE},     {"volatile", MOD_VOLATILE}, {"required", MOD_REQUIRED},
    {"file", MOD_FILE},         {"ref", MOD_REF},
};

json optional_text(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

uint32_t modifier_from_keyword(const std::string& word) {
    for (const auto& entry : kModifiers) {
        if (word == entry.keyword) return entry.flag;
    }
    return MOD_NONE;
}

std::vector<std::string> modifier_names(uint32_t modifiers) {
    std::vector<std::string> names;
    for (const auto& entry : kModifiers) {
        if (modifiers & entry.flag) names.emplace_back(entry.keyword);
    }
    return names;
}

const char* type_kind_name(TypeKind kind) {
    switch (kind) {
        case TypeKind::Class: return "class";
        case TypeKind::Interface: return "interface";
        case TypeKind::Enum: return "enum";
        case TypeKind::Record: return "record";
        case TypeKind::Struct: return "struct";
    }
    return "class";
}

const char* element_kind_name(ElementKind kind) {
    switch (kind) {
        case ElementKind::DTO: return "dto";
        case ElementKind::Service: return "service";
        case ElementKind::Controller: return "controller";
        case ElementKind::Interface: return "interface";
        case ElementKind::Enum: return "enum";
        case ElementKind::GenericClass: return "generic_class";
    }
    return "generic_class";
}

const char* member_kind_name(MemberKind kind) {
    switch (kind) {
        case MemberKind::Method: return "method";
        case MemberKind::Constructor: return "constructor";
        case MemberKind::Property: return "property";
        case MemberKind::Field: return "field";
        case MemberKind::Event: return "event";
        case MemberKind::EnumValue: return "enum_value";
        case MemberKind::Delegate: return "delegate";
    }
    return "field";
}

std::optional<ElementKind> parse_element_kind(const std::string& text) {
    std::string key;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    static const std::unordered_map<std::string, ElementKind> kNames = {
        {"dto", ElementKind::DTO},
        {"service", ElementKind::Service},
        {"controller", ElementKind::Controller},
        {"interface", ElementKind::Interface},
        {"enum", ElementKind::Enum},
        {"generic_class", ElementKind::GenericClass},
        {"genericclass", ElementKind::GenericClass},
        {"class", ElementKind::GenericClass},
    };
    auto it = kNames.find(key);
    if (it == kNames.end()) return std::nullopt;
    return it->second;
}

const std::vector<ElementKind>& all_element_kinds() {
    static const std::vector<ElementKind> kinds = {
        ElementKind::DTO, ElementKind::Service, ElementKind::Controller,
        ElementKind::Interface, ElementKind::Enum, ElementKind::GenericClass};
    return kinds;
}

json Member::to_json() const {
    json params = json::array();
    for (const auto& p : parameters) {
        params.push_back({{"type", p.type}, {"name", p.name}});
    }
    json j = {
        {"name", name},
        {"kind", member_kind_name(kind)},
        {"modifiers", modifier_names(modifiers)},
        {"signature", signature},
        {"line", line},
        {"summary", optional_text(summary)}
    };
    switch (kind) {
        case MemberKind::Method:
        case MemberKind::Constructor:
        case MemberKind::Delegate:
            j["return_type"] = return_type;
            j["parameters"] = params;
            j["is_async"] = is_async();
            j["has_body"] = has_body;
            break;
        case MemberKind::Property:
            j["type"] = return_type;
            j["has_getter"] = has_getter;
            j["has_setter"] = has_setter;
            if (!parameters.empty()) j["parameters"] = params;
            break;
        case MemberKind::Field:
        case MemberKind::Event:
            j["type"] = return_type;
            break;
        case MemberKind::EnumValue:
            break;
    }
    return j;
}

std::size_t TypeDeclaration::count_members(MemberKind member_kind) const {
    return static_cast<std::size_t>(std::count_if(members.begin(), members.end(),
        [member_kind](const Member& m) { return m.kind == member_kind; }));
}

json TypeDeclaration::to_json(bool include_members) const {
    json j = {
        {"name", name},
        {"type", type_kind_name(kind)},
        {"element_kind", element_kind_name(element_kind)},
        {"modifiers", modifier_names(modifiers)},
        {"namespace", namespace_name},
        {"file_path", containing_file},
        {"line_number", span.start_line},
        {"span", {{"start_line", span.start_line}, {"end_line", span.end_line}}},
        {"base_types", base_types},
        {"summary", optional_text(summary)}
    };
    if (!generic_parameters.empty()) j["generic_parameters"] = generic_parameters;
    if (!containing_type.empty()) j["containing_type"] = containing_type;
    if (include_members) {
        json list = json::array();
        for (const auto& m : members) list.push_back(m.to_json());
        j["members"] = list;
    } else {
        j["member_count"] = members.size();
    }
    return j;
}

json ParseWarning::to_json() const {
    return json{{"start_line", start_line}, {"end_line", end_line}, {"message", message}};
}

std::string FileMetrics::complexity() const {
    if (branch_points < 5) return "Low";
    if (branch_points < 15) return "Medium";
    return "High";
}

json FileMetrics::to_json() const {
    return json{
        {"total_lines", total_lines},
        {"code_lines", code_lines},
        {"comment_lines", comment_lines},
        {"blank_lines", blank_lines},
        {"has_xml_docs", has_xml_docs},
        {"complexity_estimate", complexity()}
    };
}

json StructuralDocument::to_json() const {
    json decls = json::array();
    for (const auto& d : declarations) decls.push_back(d.to_json());
    json warns = json::array();
    for (const auto& w : warnings) warns.push_back(w.to_json());
    return json{
        {"namespace", namespace_name ? json(*namespace_name) : json(nullptr)},
        {"usings", std::vector<std::string>(imports.begin(), imports.end())},
        {"elements", decls},
        {"warnings", warns},
        {"summary", metrics.to_json()}
    };
}

} // namespace sharpmap
