#pragma once

#include <string>
#include <vector>
#include <list>
#include <map>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

struct CacheSetOptions {
    std::optional<std::chrono::milliseconds> ttl;  // overrides the cache default
    std::vector<std::string> tags;
};

struct MemoryCacheOptions {
    size_t max_entries = 1000;
    std::chrono::milliseconds default_ttl{5 * 60 * 1000};
    bool enable_auto_cleanup = true;
    std::chrono::milliseconds cleanup_interval{60 * 1000};
    // Expired entries younger than ttl + stale_retention survive the sweep
    std::chrono::milliseconds stale_retention{0};
    std::string name = "default";
};

struct MemoryCacheStats {
    size_t size = 0;
    size_t max_entries = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_rate = 0.0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
};

struct MemoryLookup {
    std::optional<nlohmann::json> value;
    bool hit = false;
    bool stale = false;
    std::chrono::milliseconds age{0};
    std::vector<std::string> tags;
};

void to_json(nlohmann::json& j, const MemoryCacheStats& stats);

/**
 * Tier 1: bounded in-process cache with per-entry TTL, tag index and
 * LRU eviction by access order. Thread-safe.
 */
class MemoryCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit MemoryCache(MemoryCacheOptions options = {});
    ~MemoryCache();

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    std::optional<nlohmann::json> get(const std::string& key);

    // Expired entries whose age is within max_stale_age come back stale
    // instead of being purged.
    MemoryLookup get_with_meta(const std::string& key,
                               std::chrono::milliseconds max_stale_age = std::chrono::milliseconds::max());

    void set(const std::string& key, nlohmann::json value, const CacheSetOptions& options = {});
    bool has(const std::string& key);
    bool remove(const std::string& key);
    int64_t ttl(const std::string& key);

    size_t invalidate_by_tag(const std::string& tag);
    size_t invalidate_by_pattern(const std::string& pattern);

    size_t cleanup();
    void clear();

    MemoryCacheStats get_stats() const;
    std::vector<std::string> keys() const;
    size_t size() const;

    const MemoryCacheOptions& options() const { return options_; }
    void stop_auto_cleanup();

private:
    struct Entry {
        nlohmann::json value;
        Clock::time_point created_at;
        Clock::time_point expires_at;
        std::vector<std::string> tags;
        std::list<std::string>::iterator lru_pos;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    MemoryCacheOptions options_;

    mutable std::mutex mutex_;
    EntryMap entries_;
    std::list<std::string> lru_;  // front is most recently used
    std::unordered_map<std::string, std::unordered_set<std::string>> tag_index_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool stopping_ = false;

    void touch(Entry& entry);
    EntryMap::iterator erase_locked(EntryMap::iterator it);
    void evict_lru_locked();
    void sweeper_loop();
};

/**
 * Named MemoryCache instances sharing a set of default options.
 */
class MemoryCacheRegistry {
public:
    explicit MemoryCacheRegistry(MemoryCacheOptions defaults = {});

    MemoryCache& get_or_create(const std::string& name);
    MemoryCache& get_or_create(const std::string& name, MemoryCacheOptions options);
    MemoryCache* find(const std::string& name);

    void clear_all();
    std::map<std::string, MemoryCacheStats> all_stats() const;

private:
    MemoryCacheOptions defaults_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<MemoryCache>> caches_;
};

// Read-through on a single MemoryCache, without a remote tier.
// A cached value that does not convert to the fetcher's type is refetched.
template <typename Fetcher>
auto memoize(MemoryCache& cache, const std::string& key, Fetcher fetcher,
             const CacheSetOptions& options = {}) -> std::decay_t<std::invoke_result_t<Fetcher&>> {
    using T = std::decay_t<std::invoke_result_t<Fetcher&>>;

    if (auto hit = cache.get(key)) {
        try {
            return hit->get<T>();
        } catch (const std::exception& e) {
            spdlog::warn("Memoized value for {} does not convert: {}", key, e.what());
        }
    }

    T value = fetcher();
    cache.set(key, nlohmann::json(value), options);
    return value;
}
