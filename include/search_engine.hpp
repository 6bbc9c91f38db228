#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analyzer_config.hpp"
#include "index_cache.hpp"
#include "repository_indexer.hpp"

namespace sharpmap {

enum class SearchMode { Direct, Deep };

const char* search_mode_name(SearchMode mode);
std::optional<SearchMode> parse_search_mode(const std::string& text);

struct ClassMatch {
    TypeDeclaration declaration;
    bool primary = false;

    nlohmann::json to_json() const;
};

struct FindClassResult {
    std::string class_name;
    SearchMode mode = SearchMode::Direct;
    std::vector<ClassMatch> matches;
    // Direct mode only: whether several files were named after the class,
    // and which ones were not the answer.
    bool ambiguous = false;
    std::vector<std::string> other_candidates;
    std::optional<StructuralDocument> file_analysis;

    nlohmann::json to_json() const;
};

struct ElementSearchResult {
    ElementKind kind = ElementKind::GenericClass;
    std::string pattern;
    std::vector<TypeDeclaration> elements;

    nlohmann::json to_json() const;
};

struct FileAnalysis {
    std::string file_path;
    std::string content;
    SourceEncoding encoding = SourceEncoding::Utf8;
    std::uintmax_t size = 0;
    int line_count = 0;
    std::string category;
    std::optional<StructuralDocument> analysis;  // only for analysable extensions

    nlohmann::json to_json() const;
};

struct SolutionStructure {
    std::string root;
    std::shared_ptr<const IndexBuildResult> build;

    nlohmann::json to_json() const;
};

// Stateless query front over the indexer. Roots are resolved and their
// AnalyzerConfig loaded per call; when a root's config enables the index
// cache, aggregate queries go through it.
class SearchEngine {
public:
    SearchEngine() : cache_(std::make_shared<IndexCache>()) {}
    explicit SearchEngine(std::shared_ptr<IndexCache> cache) : cache_(std::move(cache)) {}

    FindClassResult find_class(const std::string& root, const std::string& class_name,
                               SearchMode mode, const CancellationToken* cancel = nullptr) const;

    ElementSearchResult find_elements(const std::string& root, ElementKind kind,
                                      const std::string& pattern, const CancellationToken* cancel = nullptr) const;

    FileAnalysis get_file_with_analysis(const std::string& root, const std::string& file_path) const;

    SolutionStructure get_solution_structure(const std::string& root, const CancellationToken* cancel = nullptr) const;

    const std::shared_ptr<IndexCache>& cache() const { return cache_; }

private:
    std::shared_ptr<IndexCache> cache_;

    std::filesystem::path resolve_root(const std::string& root) const;
    std::shared_ptr<const IndexBuildResult> index_for(const std::filesystem::path& root,
                                                      const AnalyzerConfig& config,
                                                      const CancellationToken* cancel) const;
    FindClassResult direct_search(const std::filesystem::path& root, const AnalyzerConfig& config,
                                  const std::string& class_name, const CancellationToken* cancel) const;
};

} // namespace sharpmap
