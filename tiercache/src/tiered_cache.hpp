#pragma once

#include "memory_cache.hpp"
#include "remote_cache.hpp"
#include "task_runner.hpp"
#include "wire_codec.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <mutex>
#include <chrono>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

struct Config;

struct TieredCacheOptions {
    MemoryCacheOptions memory;
    RemoteCacheOptions remote;
    bool stale_while_revalidate = true;
    std::chrono::milliseconds max_stale_age{5 * 60 * 1000};
    int background_workers = 2;
    size_t max_pending_writes = 10000;

    static TieredCacheOptions from_config(const Config& config);
};

enum class CacheSource {
    Memory,
    Redis,
    Stale,
    Origin
};

std::string to_string(CacheSource source);

template <typename T>
struct CacheResult {
    std::optional<T> value;
    bool hit = false;
    CacheSource source = CacheSource::Origin;
    bool stale = false;
    std::chrono::milliseconds age{0};
};

template <typename T>
struct FetchResult {
    T value;
    bool cached;
    bool stale;
};

struct FetchOptions {
    std::optional<std::chrono::milliseconds> ttl;
    std::vector<std::string> tags;
    bool force_refresh = false;

    CacheSetOptions set_options() const { return CacheSetOptions{ttl, tags}; }
};

struct TieredCacheStats {
    MemoryCacheStats memory;
    std::optional<RemoteCacheStats> redis;
    uint64_t total_hits = 0;
    uint64_t total_misses = 0;
    double hit_rate = 0.0;
};

void to_json(nlohmann::json& j, const TieredCacheStats& stats);

/**
 * Read-through cache over an in-process tier and an optional remote tier.
 *
 * Lookups walk memory, then remote. Writes land in memory synchronously
 * and in the remote tier on a single background writer, so remote writes
 * keep call order. Removal, invalidation and clear drain the writer before
 * touching the remote tier. get_or_fetch serves stale memory entries within
 * max_stale_age while refreshing them in the background.
 */
class TieredCache {
public:
    explicit TieredCache(TieredCacheOptions options = {});
    TieredCache(TieredCacheOptions options, std::shared_ptr<CommandTransport> transport);
    ~TieredCache();

    TieredCache(const TieredCache&) = delete;
    TieredCache& operator=(const TieredCache&) = delete;

    // Connects the remote tier if configured. Safe to call concurrently;
    // every operation calls it implicitly.
    void initialize();

    template <typename T>
    std::optional<T> get(const std::string& key) {
        auto value = get_json(key);
        if (!value) return std::nullopt;
        return convert<T>(key, *value);
    }

    template <typename T>
    CacheResult<T> get_with_meta(const std::string& key) {
        auto raw = get_json_with_meta(key);

        CacheResult<T> result;
        result.hit = raw.hit;
        result.source = raw.source;
        result.stale = raw.stale;
        result.age = raw.age;
        if (raw.value) {
            result.value = convert<T>(key, *raw.value);
            if (!result.value) {
                result.hit = false;
                result.stale = false;
                result.source = CacheSource::Origin;
            }
        }
        return result;
    }

    template <typename T>
    void set(const std::string& key, const T& value, const CacheSetOptions& options = {}) {
        set_json(key, nlohmann::json(value), options);
    }

    template <typename Fetcher>
    auto get_or_fetch(const std::string& key, Fetcher fetcher, const FetchOptions& options = {})
        -> FetchResult<std::decay_t<std::invoke_result_t<Fetcher&>>> {
        using T = std::decay_t<std::invoke_result_t<Fetcher&>>;

        initialize();

        if (options.force_refresh) {
            T value = fetcher();
            set(key, value, options.set_options());
            return FetchResult<T>{std::move(value), false, false};
        }

        auto result = get_with_meta<T>(key);

        if (result.hit && result.value) {
            return FetchResult<T>{std::move(*result.value), true, false};
        }

        if (result.stale && result.value) {
            spdlog::debug("Serving stale {} (age {}ms), revalidating", key, result.age.count());
            revalidate<T>(key, std::move(fetcher), options.set_options());
            return FetchResult<T>{std::move(*result.value), true, true};
        }

        spdlog::debug("Cache miss for {}, fetching from origin", key);
        T value = fetcher();
        set(key, value, options.set_options());
        return FetchResult<T>{std::move(value), false, false};
    }

    std::optional<nlohmann::json> get_json(const std::string& key);
    CacheResult<nlohmann::json> get_json_with_meta(const std::string& key);
    void set_json(const std::string& key, nlohmann::json value, const CacheSetOptions& options = {});

    void remove(const std::string& key);
    size_t invalidate_by_tag(const std::string& tag);
    size_t invalidate_by_pattern(const std::string& pattern);
    void clear();

    bool is_redis_available() const;
    bool is_redis_configured() const;
    TieredCacheStats get_stats() const;

    // Waits for queued revalidations and remote writes
    void flush();

    MemoryCache& memory() { return *memory_; }
    const TieredCacheOptions& options() const { return options_; }

private:
    TieredCacheOptions options_;
    std::unique_ptr<MemoryCache> memory_;
    std::unique_ptr<RemoteCache> remote_;
    std::once_flag init_flag_;
    // Declared last: drained and joined before the tiers go away.
    // Revalidations on runner_ post writes to writer_, so runner_ goes first.
    std::unique_ptr<TaskRunner> writer_;
    std::unique_ptr<TaskRunner> runner_;

    std::optional<int> remote_ttl(const CacheSetOptions& options) const;
    bool remote_ready();

    template <typename T>
    std::optional<T> convert(const std::string& key, const nlohmann::json& value) {
        if constexpr (std::is_same_v<T, nlohmann::json>) {
            return value;
        } else {
            try {
                return value.get<T>();
            } catch (const std::exception& e) {
                spdlog::warn("Cached value for {} does not convert: {}", key, e.what());
                return std::nullopt;
            }
        }
    }

    template <typename T, typename Fetcher>
    void revalidate(const std::string& key, Fetcher fetcher, CacheSetOptions options) {
        runner_->post("revalidate " + key,
            [this, key, fetcher = std::move(fetcher), options = std::move(options)]() mutable {
                T value = fetcher();
                set(key, value, options);
                spdlog::debug("Revalidated {}", key);
            });
    }
};
