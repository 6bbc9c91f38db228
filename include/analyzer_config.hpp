#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "classifier.hpp"
#include "source_provider.hpp"

namespace sharpmap {

struct IndexCacheSettings {
    bool enabled = false;
    size_t max_roots = 8;
    int ttl_seconds = 300;
};

// Per-root analysis settings. Read from <root>/.sharpmap/config.json, or
// <root>/sharpmap.json when that is absent; missing keys keep defaults.
struct AnalyzerConfig {
    std::vector<std::string> extensions = {"cs"};
    std::vector<std::string> excluded_paths = {".git", "bin", "obj", "packages", "node_modules", ".vs"};
    std::vector<std::string> included_paths;
    std::uintmax_t max_file_bytes = kDefaultMaxFileBytes;
    int worker_threads = 0;  // 0 lets OpenMP decide
    ClassifierPolicy classifier;
    IndexCacheSettings index_cache;

    PathRules path_rules() const { return PathRules(excluded_paths, included_paths); }

    // Overlays the keys present in j. Throws nlohmann::json::exception on
    // type mismatches.
    void merge(const nlohmann::json& j);
    nlohmann::json to_json() const;

    static AnalyzerConfig load(const std::filesystem::path& root);
    static std::filesystem::path locate(const std::filesystem::path& root);
};

} // namespace sharpmap
