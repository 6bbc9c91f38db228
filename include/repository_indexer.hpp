#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include "analyzer_config.hpp"
#include "cancellation.hpp"
#include "solution_index.hpp"
#include "source_provider.hpp"

namespace sharpmap {

struct IndexBuildResult {
    SolutionIndex index;
    Manifest manifest;  // fingerprints of every file the build read, see snapshot()

    const std::vector<FileWarning>& warnings() const { return index.warnings; }
};

class RepositoryIndexer {
public:
    // Called after each file, from worker threads, as (done, total).
    using ProgressCallback = std::function<void(size_t, size_t)>;

    explicit RepositoryIndexer(AnalyzerConfig config) : config_(std::move(config)) {}

    // Parses and classifies every admitted file under root. Throws
    // AnalysisError: NotFound if root is not a directory, Cancelled if the
    // token fires before the merge.
    IndexBuildResult build(const std::filesystem::path& root,
                           const CancellationToken* cancel = nullptr,
                           const ProgressCallback& on_file_indexed = nullptr) const;

    // One file: read, parse, classify. Read failures propagate.
    IndexedFile analyze_file(const SourceFile& file) const;

    // Fingerprints of the inputs a build of root depends on: the admitted
    // sources, the .csproj files and the located config file. Equal
    // snapshots mean a rebuild would produce the same index.
    Manifest snapshot(const std::filesystem::path& root) const;

    const AnalyzerConfig& config() const { return config_; }

private:
    AnalyzerConfig config_;
};

} // namespace sharpmap
