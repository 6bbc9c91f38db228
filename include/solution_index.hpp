#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "structural_document.hpp"

namespace sharpmap {

// Position of a declaration inside SolutionIndex::files.
struct DeclarationRef {
    size_t file = 0;
    size_t ordinal = 0;
};

struct IndexedFile {
    std::string relative_path;
    StructuralDocument document;
    std::string category;
    std::string project;  // root-relative path of the owning .csproj, empty if none
};

struct ProjectInfo {
    std::string name;
    std::string path;       // the .csproj, root-relative
    std::string directory;  // "" for a project at the root

    nlohmann::json to_json() const;
};

struct IndexStats {
    size_t files = 0;
    size_t classes = 0;
    size_t interfaces = 0;
    size_t enums = 0;
    size_t records = 0;
    size_t structs = 0;
    size_t methods = 0;
    size_t properties = 0;
    size_t fields = 0;
    size_t total_lines = 0;
    size_t code_lines = 0;

    nlohmann::json to_json() const;
};

struct FileWarning {
    std::string file;
    ParseWarning warning;

    nlohmann::json to_json() const;
};

// Aggregated structure of one scanned tree. Buckets hold references into
// `files`, which is sorted by relative path, so copies stay consistent.
class SolutionIndex {
public:
    std::vector<IndexedFile> files;
    std::map<std::string, std::vector<DeclarationRef>> by_namespace;
    std::map<ElementKind, std::vector<DeclarationRef>> by_kind;
    std::vector<ProjectInfo> projects;
    IndexStats stats;
    std::vector<FileWarning> warnings;

    const TypeDeclaration& at(const DeclarationRef& ref) const {
        return files[ref.file].document.declarations[ref.ordinal];
    }

    const std::vector<DeclarationRef>& of_kind(ElementKind kind) const;

    // Every declaration named exactly `name`, in index order.
    std::vector<DeclarationRef> find_by_name(const std::string& name) const;

    std::optional<size_t> find_file(const std::string& relative_path) const;

    // Rebuilds buckets and stats from `files`. Called once by the indexer
    // after the merge.
    void rebuild();

    bool empty() const { return files.empty(); }
};

} // namespace sharpmap
