#include "search_engine.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include "classifier.hpp"
#include "errors.hpp"
#include "structural_parser.hpp"

namespace sharpmap {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

json declaration_summary(const TypeDeclaration& decl) {
    return json{
        {"name", decl.name},
        {"type", type_kind_name(decl.kind)},
        {"element_kind", element_kind_name(decl.element_kind)},
        {"file_path", decl.containing_file},
        {"line_number", decl.span.start_line},
        {"member_count", decl.members.size()}
    };
}

} // namespace

const char* search_mode_name(SearchMode mode) {
    return mode == SearchMode::Deep ? "deep" : "direct";
}

std::optional<SearchMode> parse_search_mode(const std::string& text) {
    std::string key = to_lower(text);
    if (key == "direct") return SearchMode::Direct;
    if (key == "deep") return SearchMode::Deep;
    return std::nullopt;
}

// --- RESULT SERIALISATION ---

json ClassMatch::to_json() const {
    json j = declaration.to_json();
    j["primary"] = primary;
    return j;
}

json FindClassResult::to_json() const {
    json list = json::array();
    for (const auto& m : matches) list.push_back(m.to_json());
    json j = {
        {"class_name", class_name},
        {"search_type", search_mode_name(mode)},
        {"found", !matches.empty()},
        {"total_matches", matches.size()},
        {"matches", list}
    };
    if (!matches.empty()) j["file_path"] = matches.front().declaration.containing_file;
    if (mode == SearchMode::Direct) {
        j["ambiguous"] = ambiguous;
        j["other_candidates"] = other_candidates;
    }
    if (file_analysis) j["file_analysis"] = file_analysis->to_json();
    return j;
}

json ElementSearchResult::to_json() const {
    json list = json::array();
    for (const auto& e : elements) list.push_back(e.to_json(false));
    return json{
        {"element_type", element_kind_name(kind)},
        {"element_name", pattern},
        {"total_found", elements.size()},
        {"elements", list}
    };
}

json FileAnalysis::to_json() const {
    json j = {
        {"file_path", file_path},
        {"content", content},
        {"encoding", encoding_name(encoding)},
        {"size", size},
        {"lines", line_count},
        {"category", category},
        {"analysis", analysis ? analysis->to_json() : json(nullptr)}
    };
    return j;
}

json SolutionStructure::to_json() const {
    const SolutionIndex& index = build->index;

    json namespaces = json::object();
    for (const auto& [ns, refs] : index.by_namespace) {
        json list = json::array();
        for (const auto& ref : refs) list.push_back(declaration_summary(index.at(ref)));
        namespaces[ns] = list;
    }

    json counts = json::object();
    for (const auto& [kind, refs] : index.by_kind) {
        if (!refs.empty()) counts[element_kind_name(kind)] = refs.size();
    }

    json file_types = json::object();
    for (const auto& category : file_categories()) {
        json paths = json::array();
        for (const auto& f : index.files) {
            if (f.category == category) paths.push_back(f.relative_path);
        }
        if (!paths.empty()) file_types[category] = paths;
    }

    json projects = json::object();
    for (const auto& p : index.projects) {
        json j = p.to_json();
        json files = json::array();
        for (const auto& f : index.files) {
            if (f.project == p.path) files.push_back(f.relative_path);
        }
        j["files"] = files;
        projects[p.path] = j;
    }

    json warnings = json::array();
    for (const auto& w : index.warnings) warnings.push_back(w.to_json());

    return json{
        {"root", root},
        {"total_files", index.stats.files},
        {"namespaces", namespaces},
        {"element_counts", counts},
        {"stats", index.stats.to_json()},
        {"file_types", file_types},
        {"projects", projects},
        {"warnings", warnings}
    };
}

// --- QUERIES ---

fs::path SearchEngine::resolve_root(const std::string& root) const {
    if (is_blank(root)) {
        throw AnalysisError(ErrorCode::InvalidArgument, "root must not be empty");
    }
    fs::path path = fs::absolute(fs::path(root)).lexically_normal();
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        throw AnalysisError(ErrorCode::NotFound, "Root directory not found: " + root, root);
    }
    fs::path canonical = fs::canonical(path, ec);
    return ec ? path : canonical;
}

std::shared_ptr<const IndexBuildResult> SearchEngine::index_for(const fs::path& root,
                                                                const AnalyzerConfig& config,
                                                                const CancellationToken* cancel) const {
    RepositoryIndexer indexer(config);
    if (cache_ && config.index_cache.enabled) {
        cache_->configure(config.index_cache.max_roots,
                          std::chrono::seconds(std::max(config.index_cache.ttl_seconds, 0)));
        return cache_->get_or_build(indexer, root, cancel);
    }
    return std::make_shared<const IndexBuildResult>(indexer.build(root, cancel));
}

FindClassResult SearchEngine::find_class(const std::string& root, const std::string& class_name,
                                         SearchMode mode, const CancellationToken* cancel) const {
    if (is_blank(class_name)) {
        throw AnalysisError(ErrorCode::InvalidArgument, "class_name must not be empty");
    }
    fs::path root_path = resolve_root(root);
    AnalyzerConfig config = AnalyzerConfig::load(root_path);

    if (mode == SearchMode::Direct) return direct_search(root_path, config, class_name, cancel);

    auto built = index_for(root_path, config, cancel);
    FindClassResult result;
    result.class_name = class_name;
    result.mode = SearchMode::Deep;
    for (const auto& ref : built->index.find_by_name(class_name)) {
        result.matches.push_back({built->index.at(ref), result.matches.empty()});
    }
    if (result.matches.empty()) {
        throw AnalysisError(ErrorCode::NotFound, "Class '" + class_name + "' not found", class_name);
    }
    spdlog::info("🔍 Deep search '{}': {} matches", class_name, result.matches.size());
    return result;
}

FindClassResult SearchEngine::direct_search(const fs::path& root, const AnalyzerConfig& config,
                                            const std::string& class_name,
                                            const CancellationToken* cancel) const {
    std::vector<SourceFile> exact;
    std::vector<SourceFile> folded;
    for (auto& f : SourceProvider::list_files(root, config.extensions, config.path_rules())) {
        std::string stem = f.absolute_path.stem().string();
        if (stem == class_name) exact.push_back(std::move(f));
        else if (iequals(stem, class_name)) folded.push_back(std::move(f));
    }
    std::vector<SourceFile> candidates = std::move(exact);
    candidates.insert(candidates.end(), folded.begin(), folded.end());

    RepositoryIndexer indexer(config);
    for (const auto& candidate : candidates) {
        if (cancel && cancel->is_cancelled()) {
            throw AnalysisError(ErrorCode::Cancelled, "Direct search cancelled", class_name);
        }
        IndexedFile file;
        try {
            file = indexer.analyze_file(candidate);
        } catch (const AnalysisError& e) {
            spdlog::warn("⚠️  Candidate {} unreadable: {}", candidate.relative_path, e.what());
            continue;
        }

        const auto& decls = file.document.declarations;
        auto it = std::find_if(decls.begin(), decls.end(),
            [&](const TypeDeclaration& d) { return d.name == class_name; });
        if (it == decls.end()) {
            it = std::find_if(decls.begin(), decls.end(),
                [&](const TypeDeclaration& d) { return iequals(d.name, class_name); });
        }
        if (it == decls.end()) continue;

        FindClassResult result;
        result.class_name = class_name;
        result.mode = SearchMode::Direct;
        result.matches.push_back({*it, true});
        result.ambiguous = candidates.size() > 1;
        for (const auto& other : candidates) {
            if (other.relative_path != candidate.relative_path) result.other_candidates.push_back(other.relative_path);
        }
        result.file_analysis = std::move(file.document);
        spdlog::info("🎯 Direct hit '{}' in {}{}", class_name, candidate.relative_path,
                     result.ambiguous ? " (ambiguous)" : "");
        return result;
    }

    throw AnalysisError(ErrorCode::NotFound, "Class '" + class_name + "' not found by file name", class_name);
}

ElementSearchResult SearchEngine::find_elements(const std::string& root, ElementKind kind,
                                                const std::string& pattern, const CancellationToken* cancel) const {
    fs::path root_path = resolve_root(root);
    AnalyzerConfig config = AnalyzerConfig::load(root_path);
    auto built = index_for(root_path, config, cancel);

    ElementSearchResult result;
    result.kind = kind;
    result.pattern = pattern;
    const std::string needle = to_lower(pattern);
    for (const auto& ref : built->index.of_kind(kind)) {
        const TypeDeclaration& decl = built->index.at(ref);
        if (needle.empty() || to_lower(decl.name).find(needle) != std::string::npos) {
            result.elements.push_back(decl);
        }
    }
    return result;
}

FileAnalysis SearchEngine::get_file_with_analysis(const std::string& root, const std::string& file_path) const {
    if (is_blank(file_path)) {
        throw AnalysisError(ErrorCode::InvalidArgument, "file_path must not be empty");
    }
    fs::path root_path = resolve_root(root);
    AnalyzerConfig config = AnalyzerConfig::load(root_path);

    fs::path requested(file_path);
    fs::path target = requested.is_absolute() ? requested : root_path / requested;
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(target, ec);
    if (ec) resolved = target.lexically_normal();
    if (!is_inside(resolved, root_path) || resolved == root_path) {
        throw AnalysisError(ErrorCode::NotFound, "File is outside the root: " + file_path, file_path);
    }

    SourceText text = SourceProvider::read_file(resolved, config.max_file_bytes);

    FileAnalysis out;
    out.file_path = resolved.lexically_relative(root_path).generic_string();
    out.encoding = text.encoding;
    out.size = text.size;

    std::string ext = resolved.extension().string();
    if (!ext.empty()) ext = to_lower(ext.substr(1));
    bool analysable = std::any_of(config.extensions.begin(), config.extensions.end(),
        [&](std::string e) {
            if (!e.empty() && e[0] == '.') e = e.substr(1);
            return to_lower(e) == ext;
        });

    if (analysable) {
        StructuralDocument doc = StructuralParser::parse(text.content);
        for (auto& decl : doc.declarations) decl.containing_file = out.file_path;
        Classifier(config.classifier).classify_document(doc, resolved.filename().string());
        out.line_count = doc.metrics.total_lines;
        out.category = categorize_file(out.file_path, doc.declarations);
        out.analysis = std::move(doc);
    } else {
        const std::string& c = text.content;
        out.line_count = static_cast<int>(std::count(c.begin(), c.end(), '\n'));
        if (!c.empty() && c.back() != '\n') ++out.line_count;
        out.category = categorize_file(out.file_path, {});
    }
    out.content = std::move(text.content);
    return out;
}

SolutionStructure SearchEngine::get_solution_structure(const std::string& root, const CancellationToken* cancel) const {
    fs::path root_path = resolve_root(root);
    AnalyzerConfig config = AnalyzerConfig::load(root_path);
    return SolutionStructure{root_path.generic_string(), index_for(root_path, config, cancel)};
}

} // namespace sharpmap
