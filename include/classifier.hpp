#pragma once
#include <string>
#include <utility>
#include <vector>
#include "structural_document.hpp"

namespace sharpmap {

// Naming conventions that decide a declaration's role. Suffixes are
// case-sensitive, namespace segments are compared case-insensitively.
struct ClassifierPolicy {
    std::vector<std::string> dto_suffixes = {"Dto", "Request", "Response", "ViewModel"};
    std::vector<std::string> service_suffixes = {"Service"};
    std::vector<std::string> service_namespace_segments = {"Services", "Service"};
    std::vector<std::string> controller_suffixes = {"Controller"};
    std::vector<std::string> controller_base_patterns = {"Controller", "ControllerBase"};
};

struct ClassificationContext {
    std::string file_name;
    std::string namespace_name;
};

class Classifier {
public:
    explicit Classifier(ClassifierPolicy policy = {}) : policy_(std::move(policy)) {}

    // First matching rule wins: Interface, Enum, DTO, Service, Controller,
    // then GenericClass.
    ElementKind classify(const TypeDeclaration& decl, const ClassificationContext& ctx) const;

    // Sets element_kind on every declaration of the document.
    void classify_document(StructuralDocument& doc, const std::string& file_name) const;

    const ClassifierPolicy& policy() const { return policy_; }

private:
    ClassifierPolicy policy_;

    bool is_dto(const TypeDeclaration& decl) const;
    bool is_service(const TypeDeclaration& decl, const std::string& ns) const;
    bool is_controller(const TypeDeclaration& decl) const;
};

// Overview bucket of a source file: "controllers", "services", "dtos",
// "models", "interfaces", "enums", "configurations" or "others".
std::string categorize_file(const std::string& relative_path, const std::vector<TypeDeclaration>& declarations);

const std::vector<std::string>& file_categories();

// "System.Collections.Generic.List<int>" -> "List"
std::string simple_type_name(const std::string& type_name);

bool ends_with(const std::string& text, const std::string& suffix);

} // namespace sharpmap
