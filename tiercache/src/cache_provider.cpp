#include "cache_provider.hpp"
#include <spdlog/spdlog.h>

CacheProvider::CacheProvider(TieredCacheOptions options)
    : CacheProvider(std::move(options), nullptr) {}

CacheProvider::CacheProvider(TieredCacheOptions options, std::shared_ptr<CommandTransport> transport)
    : options_(std::move(options))
    , transport_(std::move(transport)) {}

std::shared_ptr<TieredCache> CacheProvider::get() {
    std::promise<std::shared_ptr<TieredCache>> promise;
    std::shared_future<std::shared_ptr<TieredCache>> instance;
    bool builder = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) {
            started_ = true;
            instance_ = promise.get_future().share();
            builder = true;
        }
        instance = instance_;
    }

    if (builder) {
        try {
            auto cache = std::make_shared<TieredCache>(options_, transport_);
            cache->initialize();
            spdlog::info("Tiered cache ready (remote tier {})",
                         cache->is_redis_available() ? "connected" :
                         cache->is_redis_configured() ? "unavailable" : "not configured");
            promise.set_value(std::move(cache));
        } catch (const std::exception& e) {
            spdlog::error("Failed to build tiered cache: {}", e.what());
            promise.set_exception(std::current_exception());
        }
    }

    return instance.get();
}

bool CacheProvider::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && instance_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}
