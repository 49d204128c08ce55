#pragma once

#include "tiered_cache.hpp"
#include <memory>
#include <mutex>
#include <future>

/**
 * Owns the process's TieredCache. The first get() builds and connects it;
 * callers arriving while that is in flight wait on the same future, so the
 * remote connection is made once per provider.
 */
class CacheProvider {
public:
    explicit CacheProvider(TieredCacheOptions options);
    CacheProvider(TieredCacheOptions options, std::shared_ptr<CommandTransport> transport);

    std::shared_ptr<TieredCache> get();
    bool is_initialized() const;

private:
    TieredCacheOptions options_;
    std::shared_ptr<CommandTransport> transport_;

    mutable std::mutex mutex_;
    bool started_ = false;
    std::shared_future<std::shared_ptr<TieredCache>> instance_;
};

// get_or_fetch through the provider, returning only the value
template <typename Fetcher>
auto cached(CacheProvider& provider, const std::string& key, Fetcher fetcher,
            const FetchOptions& options = {}) {
    auto cache = provider.get();
    return cache->get_or_fetch(key, std::move(fetcher), options).value;
}
