#include "tiered_cache.hpp"
#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <regex>

TieredCacheOptions TieredCacheOptions::from_config(const Config& config) {
    TieredCacheOptions options;

    options.memory.max_entries = static_cast<size_t>(config.memory_max_entries);
    options.memory.default_ttl = std::chrono::milliseconds(config.memory_default_ttl_ms);
    options.memory.enable_auto_cleanup = config.memory_auto_cleanup;
    options.memory.cleanup_interval = std::chrono::milliseconds(config.memory_cleanup_interval_ms);

    options.remote.url = config.redis_url;
    options.remote.key_prefix = config.key_prefix;
    options.remote.default_ttl_seconds = config.redis_default_ttl_seconds;
    options.remote.connect_timeout_ms = config.redis_connect_timeout_ms;
    options.remote.command_timeout_ms = config.redis_command_timeout_ms;

    options.stale_while_revalidate = config.stale_while_revalidate;
    options.max_stale_age = std::chrono::milliseconds(config.max_stale_age_ms);
    options.background_workers = config.background_workers;
    options.max_pending_writes = static_cast<size_t>(config.max_pending_writes);
    return options;
}

std::string to_string(CacheSource source) {
    switch (source) {
        case CacheSource::Memory: return "memory";
        case CacheSource::Redis: return "redis";
        case CacheSource::Stale: return "stale";
        case CacheSource::Origin: return "origin";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const TieredCacheStats& stats) {
    j = nlohmann::json{
        {"memory", stats.memory},
        {"redis", nullptr},
        {"total_hits", stats.total_hits},
        {"total_misses", stats.total_misses},
        {"hit_rate", stats.hit_rate}
    };
    if (stats.redis) {
        j["redis"] = *stats.redis;
    }
}

TieredCache::TieredCache(TieredCacheOptions options)
    : TieredCache(std::move(options), nullptr) {}

TieredCache::TieredCache(TieredCacheOptions options, std::shared_ptr<CommandTransport> transport)
    : options_(std::move(options))
{
    if (options_.memory.name.empty() || options_.memory.name == "default") {
        options_.memory.name = "tiered-l1";
    }
    // The sweep must not purge what may still be served stale
    if (options_.stale_while_revalidate) {
        options_.memory.stale_retention = options_.max_stale_age;
    }

    memory_ = std::make_unique<MemoryCache>(options_.memory);

    if (transport || !options_.remote.url.empty()) {
        remote_ = std::make_unique<RemoteCache>(options_.remote, std::move(transport));
    }

    writer_ = std::make_unique<TaskRunner>(1, options_.max_pending_writes);
    runner_ = std::make_unique<TaskRunner>(options_.background_workers);
}

TieredCache::~TieredCache() {
    // Revalidations may still post remote writes; let them all land
    runner_->wait_idle();
    writer_->wait_idle();
}

void TieredCache::initialize() {
    std::call_once(init_flag_, [this]() {
        if (remote_) {
            remote_->connect();
        }
    });
}

void TieredCache::flush() {
    runner_->wait_idle();
    writer_->wait_idle();
}

bool TieredCache::remote_ready() {
    if (!remote_ || !remote_->is_available()) {
        return false;
    }
    // Queued writes must not land after the delete that follows
    writer_->wait_idle();
    return true;
}

std::optional<int> TieredCache::remote_ttl(const CacheSetOptions& options) const {
    if (!options.ttl) {
        return options_.remote.default_ttl_seconds;
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(*options.ttl).count();
    return static_cast<int>(std::max<int64_t>(1, seconds));
}

std::optional<nlohmann::json> TieredCache::get_json(const std::string& key) {
    initialize();

    auto value = memory_->get(key);
    if (value) {
        return value;
    }

    if (remote_ && remote_->is_available()) {
        auto lookup = remote_->get_with_meta(key);
        if (lookup.hit && lookup.value) {
            memory_->set(key, *lookup.value, CacheSetOptions{std::nullopt, lookup.tags});
            return lookup.value;
        }
    }

    return std::nullopt;
}

CacheResult<nlohmann::json> TieredCache::get_json_with_meta(const std::string& key) {
    initialize();

    auto max_stale = options_.stale_while_revalidate ? options_.max_stale_age
                                                     : std::chrono::milliseconds::zero();
    auto memory_result = memory_->get_with_meta(key, max_stale);

    CacheResult<nlohmann::json> result;

    if (memory_result.hit) {
        result.value = std::move(memory_result.value);
        result.hit = true;
        result.source = CacheSource::Memory;
        result.age = memory_result.age;
        return result;
    }

    if (memory_result.stale && options_.stale_while_revalidate &&
        memory_result.age <= options_.max_stale_age) {
        result.value = std::move(memory_result.value);
        result.source = CacheSource::Stale;
        result.stale = true;
        result.age = memory_result.age;
        return result;
    }

    if (remote_ && remote_->is_available()) {
        auto lookup = remote_->get_with_meta(key);
        if (lookup.hit && lookup.value) {
            memory_->set(key, *lookup.value, CacheSetOptions{std::nullopt, lookup.tags});
            result.value = std::move(lookup.value);
            result.hit = true;
            result.source = CacheSource::Redis;
            result.age = lookup.age;
            return result;
        }
    }

    return result;
}

void TieredCache::set_json(const std::string& key, nlohmann::json value, const CacheSetOptions& options) {
    initialize();

    if (remote_ && remote_->is_available()) {
        auto ttl = remote_ttl(options);
        auto tags = options.tags;
        auto remote_value = value;
        writer_->post("remote write " + key,
            [this, key, remote_value = std::move(remote_value), ttl, tags = std::move(tags)]() {
                if (!remote_->set(key, remote_value, ttl, tags)) {
                    spdlog::warn("[TieredCache] Redis write failed for {}", key);
                }
            });
    }

    memory_->set(key, std::move(value), options);
}

void TieredCache::remove(const std::string& key) {
    initialize();

    memory_->remove(key);

    if (remote_ready()) {
        remote_->remove(key);
    }
}

size_t TieredCache::invalidate_by_tag(const std::string& tag) {
    initialize();

    size_t count = memory_->invalidate_by_tag(tag);

    if (remote_ready()) {
        count += remote_->invalidate_by_tag(tag);
    }
    return count;
}

size_t TieredCache::invalidate_by_pattern(const std::string& pattern) {
    initialize();

    size_t count = memory_->invalidate_by_pattern(pattern);

    if (remote_ready()) {
        // The glob only narrows KEYS; the regex decides what is deleted
        auto glob = util::regex_to_glob(pattern);
        if (!glob) {
            spdlog::debug("[TieredCache] Pattern {} has no KEYS equivalent, scanning all keys", pattern);
        }

        std::regex re(pattern, std::regex::ECMAScript);
        count += remote_->delete_by_pattern(glob.value_or("*"), [&re](const std::string& key) {
            return std::regex_search(key, re);
        });
    }
    return count;
}

void TieredCache::clear() {
    initialize();

    memory_->clear();

    if (remote_ready()) {
        remote_->clear();
    }
}

bool TieredCache::is_redis_available() const {
    return remote_ && remote_->is_available();
}

bool TieredCache::is_redis_configured() const {
    return remote_ != nullptr;
}

TieredCacheStats TieredCache::get_stats() const {
    TieredCacheStats stats;
    stats.memory = memory_->get_stats();
    if (remote_) {
        stats.redis = remote_->get_stats();
    }

    stats.total_hits = stats.memory.hits + (stats.redis ? stats.redis->hits : 0);
    stats.total_misses = stats.memory.misses + (stats.redis ? stats.redis->misses : 0);

    uint64_t total = stats.total_hits + stats.total_misses;
    stats.hit_rate = total > 0 ? static_cast<double>(stats.total_hits) / static_cast<double>(total) : 0.0;
    return stats;
}
