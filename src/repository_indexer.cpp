#include "repository_indexer.hpp"
#include <chrono>
#include <optional>
#include <omp.h>
#include <spdlog/spdlog.h>
#include "classifier.hpp"
#include "errors.hpp"
#include "structural_parser.hpp"

namespace sharpmap {

namespace fs = std::filesystem;

namespace {

// Result slot written by exactly one worker.
struct FileSlot {
    std::optional<IndexedFile> file;
    std::optional<ParseWarning> failure;
};

std::string owning_project(const std::string& relative_path, const std::vector<ProjectInfo>& projects) {
    const ProjectInfo* best = nullptr;
    size_t best_length = 0;
    for (const auto& p : projects) {
        if (!is_inside(fs::path(relative_path), fs::path(p.directory))) continue;
        if (!best || p.directory.size() > best_length) {
            best = &p;
            best_length = p.directory.size();
        }
    }
    return best ? best->path : std::string();
}

std::vector<ProjectInfo> to_projects(const std::vector<SourceFile>& project_files) {
    std::vector<ProjectInfo> projects;
    for (const auto& f : project_files) {
        ProjectInfo p;
        fs::path rel(f.relative_path);
        p.name = rel.stem().string();
        p.path = f.relative_path;
        p.directory = rel.parent_path().generic_string();
        projects.push_back(std::move(p));
    }
    return projects;
}

Manifest manifest_of(const fs::path& root,
                     const std::vector<SourceFile>& sources,
                     const std::vector<SourceFile>& project_files) {
    Manifest manifest = SourceProvider::build_manifest(sources);
    for (const auto& f : project_files) manifest[f.relative_path] = f.fingerprint;

    fs::path config_path = AnalyzerConfig::locate(root);
    if (!config_path.empty()) {
        manifest[config_path.lexically_relative(root).generic_string()] =
            SourceProvider::calculate_file_hash(config_path);
    }
    return manifest;
}

} // namespace

IndexedFile RepositoryIndexer::analyze_file(const SourceFile& file) const {
    SourceText text = SourceProvider::read_file(file.absolute_path, config_.max_file_bytes);

    IndexedFile out;
    out.relative_path = file.relative_path;
    out.document = StructuralParser::parse(text.content);
    for (auto& decl : out.document.declarations) decl.containing_file = file.relative_path;

    Classifier classifier(config_.classifier);
    classifier.classify_document(out.document, file.absolute_path.filename().string());
    out.category = categorize_file(file.relative_path, out.document.declarations);
    return out;
}

Manifest RepositoryIndexer::snapshot(const fs::path& root) const {
    const PathRules rules = config_.path_rules();
    return manifest_of(root,
                       SourceProvider::list_files(root, config_.extensions, rules),
                       SourceProvider::list_files(root, {"csproj"}, rules));
}

IndexBuildResult RepositoryIndexer::build(const fs::path& root,
                                          const CancellationToken* cancel,
                                          const ProgressCallback& on_file_indexed) const {
    auto start = std::chrono::high_resolution_clock::now();
    const PathRules rules = config_.path_rules();

    // --- PHASE 1: SERIAL DISCOVERY ---
    std::vector<SourceFile> sources = SourceProvider::list_files(root, config_.extensions, rules);
    std::vector<SourceFile> project_files = SourceProvider::list_files(root, {"csproj"}, rules);
    const int total = static_cast<int>(sources.size());

    // --- PHASE 2: PARALLEL PARSE ---
    std::vector<FileSlot> slots(sources.size());
    size_t done = 0;
    const int threads = config_.worker_threads > 0 ? config_.worker_threads : omp_get_max_threads();

    #pragma omp parallel for num_threads(threads) schedule(dynamic)
    for (int i = 0; i < total; ++i) {
        if (cancel && cancel->is_cancelled()) continue;

        const SourceFile& source = sources[i];
        try {
            slots[i].file = analyze_file(source);
        } catch (const AnalysisError& e) {
            spdlog::warn("⚠️  Skipping {}: {}", source.relative_path, e.what());
            slots[i].failure = ParseWarning{0, 0, std::string("file not analysed: ") + e.what()};
        } catch (const std::exception& e) {
            spdlog::error("❌ Analysis failed for {}: {}", source.relative_path, e.what());
            slots[i].failure = ParseWarning{0, 0, std::string("file not analysed: ") + e.what()};
        }

        if (on_file_indexed) {
            #pragma omp critical(sharpmap_progress)
            {
                ++done;
                on_file_indexed(done, sources.size());
            }
        }
    }

    if (cancel && cancel->is_cancelled()) {
        spdlog::info("🛑 Index build cancelled for {}", root.string());
        throw AnalysisError(ErrorCode::Cancelled, "Index build cancelled", root.string());
    }

    // --- PHASE 3: SERIAL MERGE (ascending path order) ---
    IndexBuildResult result;
    SolutionIndex& index = result.index;
    index.projects = to_projects(project_files);
    result.manifest = manifest_of(root, sources, project_files);

    for (size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].failure) {
            index.warnings.push_back({sources[i].relative_path, *slots[i].failure});
            continue;
        }
        if (!slots[i].file) continue;
        IndexedFile& file = *slots[i].file;
        for (const auto& w : file.document.warnings) {
            index.warnings.push_back({file.relative_path, w});
        }
        file.project = owning_project(file.relative_path, index.projects);
        index.files.push_back(std::move(file));
    }
    index.rebuild();

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::info("🛰️ Index built | {} | {} files, {} types, {} warnings in {:.1f} ms",
                 root.generic_string(), index.stats.files,
                 index.stats.classes + index.stats.interfaces + index.stats.enums + index.stats.records + index.stats.structs,
                 index.warnings.size(), duration);
    return result;
}

} // namespace sharpmap
