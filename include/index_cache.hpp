#pragma once

#include <chrono>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "repository_indexer.hpp"

namespace sharpmap {

// Root-keyed store of built indexes with LRU eviction and expiry. Every
// read takes a fresh RepositoryIndexer::snapshot and compares it with the
// manifest the entry was built from, so stale entries are rebuilt rather
// than served.
class IndexCache {
public:
    explicit IndexCache(size_t max_roots = 8, std::chrono::seconds ttl = std::chrono::seconds(300))
        : max_roots_(max_roots), ttl_(ttl) {}

    // Cached index for root, building (and storing) it when absent, expired
    // or stale. A cancelled build throws and leaves the cache untouched.
    std::shared_ptr<const IndexBuildResult> get_or_build(const RepositoryIndexer& indexer,
                                                         const std::filesystem::path& root,
                                                         const CancellationToken* cancel = nullptr);

    // New limits apply to entries stored from now on; entries beyond
    // max_roots are evicted immediately, least recently used first.
    void configure(size_t max_roots, std::chrono::seconds ttl);

    void notify_file_changed(const std::filesystem::path& root, const std::string& relative_path);
    void invalidate(const std::filesystem::path& root);
    void clear();

    size_t size() const;
    size_t builds() const;

    static std::string key_for(const std::filesystem::path& root);

private:
    struct CacheEntry {
        std::shared_ptr<const IndexBuildResult> value;
        std::list<std::string>::iterator list_it;
        std::chrono::steady_clock::time_point expiry_time;
    };

    std::shared_ptr<const IndexBuildResult> lookup(const std::string& key, const Manifest& current);
    void store(const std::string& key, std::shared_ptr<const IndexBuildResult> value);
    void erase_locked(const std::string& key);

    size_t max_roots_;
    std::chrono::seconds ttl_;
    std::list<std::string> cache_list_;
    std::unordered_map<std::string, CacheEntry> cache_map_;
    size_t builds_ = 0;
    mutable std::mutex mutex_;
};

} // namespace sharpmap
