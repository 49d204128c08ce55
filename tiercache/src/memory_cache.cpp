#include "memory_cache.hpp"
#include <spdlog/spdlog.h>
#include <regex>
#include <algorithm>

void to_json(nlohmann::json& j, const MemoryCacheStats& stats) {
    j = nlohmann::json{
        {"size", stats.size},
        {"max_entries", stats.max_entries},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hit_rate", stats.hit_rate},
        {"evictions", stats.evictions},
        {"expirations", stats.expirations}
    };
}

MemoryCache::MemoryCache(MemoryCacheOptions options) : options_(std::move(options)) {
    if (options_.max_entries == 0) {
        options_.max_entries = 1;
    }
    if (options_.cleanup_interval <= std::chrono::milliseconds::zero()) {
        options_.cleanup_interval = std::chrono::milliseconds(60 * 1000);
    }

    if (options_.enable_auto_cleanup) {
        sweeper_ = std::thread(&MemoryCache::sweeper_loop, this);
    }
}

MemoryCache::~MemoryCache() {
    stop_auto_cleanup();
}

void MemoryCache::stop_auto_cleanup() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        stopping_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void MemoryCache::sweeper_loop() {
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!stopping_) {
        sweeper_cv_.wait_for(lock, options_.cleanup_interval, [this]() { return stopping_; });
        if (stopping_) break;

        lock.unlock();
        size_t purged = cleanup();
        if (purged > 0) {
            spdlog::debug("[{}] swept {} expired entries", options_.name, purged);
        }
        lock.lock();
    }
}

void MemoryCache::touch(Entry& entry) {
    lru_.splice(lru_.begin(), lru_, entry.lru_pos);
}

MemoryCache::EntryMap::iterator MemoryCache::erase_locked(EntryMap::iterator it) {
    for (const auto& tag : it->second.tags) {
        auto tag_it = tag_index_.find(tag);
        if (tag_it == tag_index_.end()) continue;
        tag_it->second.erase(it->first);
        if (tag_it->second.empty()) {
            tag_index_.erase(tag_it);
        }
    }
    lru_.erase(it->second.lru_pos);
    return entries_.erase(it);
}

void MemoryCache::evict_lru_locked() {
    if (lru_.empty()) return;

    auto it = entries_.find(lru_.back());
    if (it != entries_.end()) {
        spdlog::debug("[{}] evicting LRU entry {}", options_.name, it->first);
        erase_locked(it);
        evictions_++;
    }
}

std::optional<nlohmann::json> MemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return std::nullopt;
    }

    if (Clock::now() > it->second.expires_at) {
        erase_locked(it);
        misses_++;
        expirations_++;
        return std::nullopt;
    }

    touch(it->second);
    hits_++;
    return it->second.value;
}

MemoryLookup MemoryCache::get_with_meta(const std::string& key,
                                        std::chrono::milliseconds max_stale_age) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemoryLookup result;

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return result;
    }

    auto now = Clock::now();
    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second.created_at);

    if (now > it->second.expires_at) {
        misses_++;
        if (age > max_stale_age) {
            erase_locked(it);
            expirations_++;
            return result;
        }

        // Kept in place so a later refresh or sweep decides its fate
        result.value = it->second.value;
        result.stale = true;
        result.age = age;
        result.tags = it->second.tags;
        return result;
    }

    touch(it->second);
    hits_++;

    result.value = it->second.value;
    result.hit = true;
    result.age = age;
    result.tags = it->second.tags;
    return result;
}

void MemoryCache::set(const std::string& key, nlohmann::json value, const CacheSetOptions& options) {
    auto ttl = options.ttl.value_or(options_.default_ttl);
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        erase_locked(existing);
    } else if (entries_.size() >= options_.max_entries) {
        evict_lru_locked();
    }

    lru_.push_front(key);

    Entry entry;
    entry.value = std::move(value);
    entry.created_at = now;
    entry.expires_at = now + ttl;
    entry.lru_pos = lru_.begin();

    for (const auto& tag : options.tags) {
        if (std::find(entry.tags.begin(), entry.tags.end(), tag) != entry.tags.end()) continue;
        entry.tags.push_back(tag);
        tag_index_[tag].insert(key);
    }

    entries_.emplace(key, std::move(entry));
}

bool MemoryCache::has(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return false;

    if (Clock::now() > it->second.expires_at) {
        erase_locked(it);
        expirations_++;
        return false;
    }
    return true;
}

bool MemoryCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return false;

    erase_locked(it);
    return true;
}

int64_t MemoryCache::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return -1;

    auto now = Clock::now();
    if (now > it->second.expires_at) return -1;

    auto remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        it->second.expires_at - now).count();
    return (remaining_ms + 999) / 1000;
}

size_t MemoryCache::invalidate_by_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto tag_it = tag_index_.find(tag);
    if (tag_it == tag_index_.end()) return 0;

    // erase_locked mutates the index, so work from a copy
    std::vector<std::string> keys(tag_it->second.begin(), tag_it->second.end());

    size_t count = 0;
    for (const auto& key : keys) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            erase_locked(it);
            count++;
        }
    }
    tag_index_.erase(tag);
    return count;
}

size_t MemoryCache::invalidate_by_pattern(const std::string& pattern) {
    std::regex re(pattern, std::regex::ECMAScript);

    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (std::regex_search(it->first, re)) {
            it = erase_locked(it);
            count++;
        } else {
            ++it;
        }
    }
    return count;
}

size_t MemoryCache::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = Clock::now();
    size_t count = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now > it->second.expires_at + options_.stale_retention) {
            it = erase_locked(it);
            expirations_++;
            count++;
        } else {
            ++it;
        }
    }
    return count;
}

void MemoryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    entries_.clear();
    lru_.clear();
    tag_index_.clear();
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    expirations_ = 0;
}

MemoryCacheStats MemoryCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    MemoryCacheStats stats;
    stats.size = entries_.size();
    stats.max_entries = options_.max_entries;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.expirations = expirations_;

    uint64_t total = hits_ + misses_;
    stats.hit_rate = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
    return stats;
}

std::vector<std::string> MemoryCache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lru_.begin(), lru_.end());
}

size_t MemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

MemoryCacheRegistry::MemoryCacheRegistry(MemoryCacheOptions defaults)
    : defaults_(std::move(defaults)) {}

MemoryCache& MemoryCacheRegistry::get_or_create(const std::string& name) {
    return get_or_create(name, defaults_);
}

MemoryCache& MemoryCacheRegistry::get_or_create(const std::string& name, MemoryCacheOptions options) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = caches_.find(name);
    if (it != caches_.end()) {
        return *it->second;
    }

    options.name = name;
    auto cache = std::make_unique<MemoryCache>(std::move(options));
    auto& ref = *cache;
    caches_.emplace(name, std::move(cache));
    spdlog::debug("Created memory cache '{}'", name);
    return ref;
}

MemoryCache* MemoryCacheRegistry::find(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(name);
    return it != caches_.end() ? it->second.get() : nullptr;
}

void MemoryCacheRegistry::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, cache] : caches_) {
        cache->clear();
    }
}

std::map<std::string, MemoryCacheStats> MemoryCacheRegistry::all_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, MemoryCacheStats> stats;
    for (const auto& [name, cache] : caches_) {
        stats[name] = cache->get_stats();
    }
    return stats;
}
