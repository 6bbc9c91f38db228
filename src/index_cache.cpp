#include "index_cache.hpp"
#include <spdlog/spdlog.h>

namespace sharpmap {

namespace fs = std::filesystem;

std::string IndexCache::key_for(const fs::path& root) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(root, ec);
    if (ec) canonical = fs::absolute(root).lexically_normal();
    return canonical.generic_string();
}

std::shared_ptr<const IndexBuildResult> IndexCache::get_or_build(const RepositoryIndexer& indexer,
                                                                 const fs::path& root,
                                                                 const CancellationToken* cancel) {
    const std::string key = key_for(root);
    Manifest current = indexer.snapshot(root);

    if (auto hit = lookup(key, current)) {
        spdlog::debug("♻️  Index cache hit: {}", key);
        return hit;
    }

    // Built outside the lock; concurrent misses on one root may both build.
    auto built = std::make_shared<const IndexBuildResult>(indexer.build(root, cancel));
    store(key, built);
    return built;
}

std::shared_ptr<const IndexBuildResult> IndexCache::lookup(const std::string& key, const Manifest& current) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) return nullptr;

    auto now = std::chrono::steady_clock::now();
    if (now > it->second.expiry_time) {
        spdlog::debug("⌛ Index cache entry expired: {}", key);
        erase_locked(key);
        return nullptr;
    }
    if (it->second.value->manifest != current) {
        spdlog::info("🔄 Tree changed since last index, rebuilding: {}", key);
        erase_locked(key);
        return nullptr;
    }

    cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
    return it->second.value;
}

void IndexCache::store(const std::string& key, std::shared_ptr<const IndexBuildResult> value) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++builds_;
    if (max_roots_ == 0) return;

    auto expiry = std::chrono::steady_clock::now() + ttl_;
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        it->second.value = std::move(value);
        it->second.expiry_time = expiry;
        cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
        return;
    }
    if (cache_map_.size() >= max_roots_) {
        // Evict LRU
        erase_locked(cache_list_.back());
    }
    cache_list_.push_front(key);
    cache_map_[key] = {std::move(value), cache_list_.begin(), expiry};
}

void IndexCache::configure(size_t max_roots, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_roots == max_roots_ && ttl == ttl_) return;
    spdlog::debug("Index cache limits: {} roots, {}s", max_roots, ttl.count());
    max_roots_ = max_roots;
    ttl_ = ttl;
    while (cache_map_.size() > max_roots_) {
        erase_locked(cache_list_.back());
    }
}

void IndexCache::erase_locked(const std::string& key) {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) return;
    cache_list_.erase(it->second.list_it);
    cache_map_.erase(it);
}

void IndexCache::notify_file_changed(const fs::path& root, const std::string& relative_path) {
    spdlog::debug("📝 File changed: {} in {}", relative_path, root.string());
    invalidate(root);
}

void IndexCache::invalidate(const fs::path& root) {
    const std::string key = key_for(root);
    std::lock_guard<std::mutex> lock(mutex_);
    erase_locked(key);
}

void IndexCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_map_.clear();
    cache_list_.clear();
}

size_t IndexCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_map_.size();
}

size_t IndexCache::builds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builds_;
}

} // namespace sharpmap
