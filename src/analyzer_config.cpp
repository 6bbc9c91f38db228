#include "analyzer_config.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace sharpmap {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void merge_list(const json& j, const char* key, std::vector<std::string>& target) {
    if (j.contains(key)) target = j.at(key).get<std::vector<std::string>>();
}

} // namespace

void AnalyzerConfig::merge(const json& j) {
    // Throws type_error for anything but an object.
    j.get_ref<const json::object_t&>();

    merge_list(j, "extensions", extensions);
    merge_list(j, "excluded_paths", excluded_paths);
    merge_list(j, "included_paths", included_paths);
    max_file_bytes = j.value("max_file_bytes", max_file_bytes);
    worker_threads = j.value("worker_threads", worker_threads);

    if (j.contains("classifier")) {
        const json& c = j.at("classifier");
        merge_list(c, "dto_suffixes", classifier.dto_suffixes);
        merge_list(c, "service_suffixes", classifier.service_suffixes);
        merge_list(c, "service_namespace_segments", classifier.service_namespace_segments);
        merge_list(c, "controller_suffixes", classifier.controller_suffixes);
        merge_list(c, "controller_base_patterns", classifier.controller_base_patterns);
    }
    if (j.contains("index_cache")) {
        const json& c = j.at("index_cache");
        index_cache.enabled = c.value("enabled", index_cache.enabled);
        index_cache.max_roots = c.value("max_roots", index_cache.max_roots);
        index_cache.ttl_seconds = c.value("ttl_seconds", index_cache.ttl_seconds);
    }
}

json AnalyzerConfig::to_json() const {
    return json{
        {"extensions", extensions},
        {"excluded_paths", excluded_paths},
        {"included_paths", included_paths},
        {"max_file_bytes", max_file_bytes},
        {"worker_threads", worker_threads},
        {"classifier", {
            {"dto_suffixes", classifier.dto_suffixes},
            {"service_suffixes", classifier.service_suffixes},
            {"service_namespace_segments", classifier.service_namespace_segments},
            {"controller_suffixes", classifier.controller_suffixes},
            {"controller_base_patterns", classifier.controller_base_patterns}
        }},
        {"index_cache", {
            {"enabled", index_cache.enabled},
            {"max_roots", index_cache.max_roots},
            {"ttl_seconds", index_cache.ttl_seconds}
        }}
    };
}

fs::path AnalyzerConfig::locate(const fs::path& root) {
    fs::path config_path = root / ".sharpmap" / "config.json";
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        config_path = root / "sharpmap.json";
    }
    return fs::exists(config_path, ec) ? config_path : fs::path();
}

AnalyzerConfig AnalyzerConfig::load(const fs::path& root) {
    AnalyzerConfig config;
    fs::path config_path = locate(root);
    if (config_path.empty()) return config;

    try {
        std::ifstream f(config_path);
        auto j = json::parse(f);
        AnalyzerConfig merged = config;
        merged.merge(j);
        config = std::move(merged);
        spdlog::info("⚙️  Config loaded: {} ignores, {} exceptions, {} extensions.",
                     config.excluded_paths.size(), config.included_paths.size(), config.extensions.size());
    } catch (const json::exception& e) {
        spdlog::error("❌ Config corrupted at {}: {}", config_path.string(), e.what());
    }
    return config;
}

} // namespace sharpmap
