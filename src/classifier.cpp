#include "classifier.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace sharpmap {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool ends_with_any(const std::string& text, const std::vector<std::string>& suffixes) {
    for (const auto& s : suffixes) {
        if (!s.empty() && ends_with(text, s)) return true;
    }
    return false;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string simple_type_name(const std::string& type_name) {
    std::string name = type_name.substr(0, type_name.find('<'));
    size_t dot = name.find_last_of(".:");
    if (dot != std::string::npos) name = name.substr(dot + 1);
    name.erase(std::remove_if(name.begin(), name.end(),
        [](unsigned char c) { return std::isspace(c); }), name.end());
    return name;
}

ElementKind Classifier::classify(const TypeDeclaration& decl, const ClassificationContext& ctx) const {
    if (decl.kind == TypeKind::Interface) return ElementKind::Interface;
    if (decl.kind == TypeKind::Enum) return ElementKind::Enum;
    if (is_dto(decl)) return ElementKind::DTO;

    const std::string& ns = ctx.namespace_name.empty() ? decl.namespace_name : ctx.namespace_name;
    if (is_service(decl, ns)) return ElementKind::Service;
    if (is_controller(decl)) return ElementKind::Controller;
    return ElementKind::GenericClass;
}

void Classifier::classify_document(StructuralDocument& doc, const std::string& file_name) const {
    for (auto& decl : doc.declarations) {
        decl.element_kind = classify(decl, {file_name, decl.namespace_name});
    }
}

bool Classifier::is_dto(const TypeDeclaration& decl) const {
    if (!ends_with_any(decl.name, policy_.dto_suffixes)) return false;
    // Constructors only assign state, so they do not disqualify a DTO.
    return std::none_of(decl.members.begin(), decl.members.end(), [](const Member& m) {
        return m.kind == MemberKind::Method && m.has_nontrivial_body;
    });
}

bool Classifier::is_service(const TypeDeclaration& decl, const std::string& ns) const {
    if (ends_with_any(decl.name, policy_.service_suffixes)) return true;

    size_t start = 0;
    while (start <= ns.size()) {
        size_t dot = ns.find('.', start);
        std::string segment = to_lower(ns.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        for (const auto& s : policy_.service_namespace_segments) {
            if (!segment.empty() && segment == to_lower(s)) return true;
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return false;
}

bool Classifier::is_controller(const TypeDeclaration& decl) const {
    if (ends_with_any(decl.name, policy_.controller_suffixes)) return true;
    for (const auto& base : decl.base_types) {
        if (ends_with_any(simple_type_name(base), policy_.controller_base_patterns)) return true;
    }
    return false;
}

const std::vector<std::string>& file_categories() {
    static const std::vector<std::string> categories = {
        "controllers", "services", "dtos", "models", "interfaces", "enums", "configurations", "others"};
    return categories;
}

std::string categorize_file(const std::string& relative_path, const std::vector<TypeDeclaration>& declarations) {
    const std::string path = "/" + to_lower(relative_path);
    const std::string name = to_lower(fs::path(relative_path).filename().string());

    auto any_kind = [&](TypeKind kind) {
        return std::any_of(declarations.begin(), declarations.end(),
            [kind](const TypeDeclaration& d) { return d.kind == kind; });
    };

    if (contains(name, "controller") || contains(path, "/controllers/")) return "controllers";
    if (contains(name, "service") || contains(path, "/services/")) return "services";
    if (contains(name, "dto") || contains(path, "/dtos/") || contains(path, "/models/dto")) return "dtos";
    if (contains(path, "/models/")) return "models";
    if (!name.empty() && name[0] == 'i' && any_kind(TypeKind::Interface)) return "interfaces";
    if (any_kind(TypeKind::Enum)) return "enums";
    if (contains(name, "config") || contains(path, "/configuration/")) return "configurations";
    return "others";
}

} // namespace sharpmap
