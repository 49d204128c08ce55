#include "health.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

HealthCheck::HealthCheck(CacheProvider& provider, const Config& config)
    : provider_(provider), config_(config), start_ms_(util::current_timestamp_ms()) {}

nlohmann::json HealthCheck::check_redis() {
    int64_t started = util::current_timestamp_ms();

    try {
        auto cache = provider_.get();
        int64_t latency = util::current_timestamp_ms() - started;

        if (!cache->is_redis_configured()) {
            return {{"status", "warn"}, {"message", "Redis not configured (using in-memory cache)"}};
        }
        if (cache->is_redis_available()) {
            return {{"status", "pass"}, {"message", "Redis connected"}, {"latency", latency}};
        }
        return {{"status", "warn"}, {"message", "Redis configured but not connected"}, {"latency", latency}};

    } catch (const std::exception& e) {
        spdlog::error("Redis health check failed: {}", e.what());
        return {{"status", "fail"}, {"message", e.what()},
                {"latency", util::current_timestamp_ms() - started}};
    }
}

nlohmann::json HealthCheck::get_status() {
    nlohmann::json checks = {
        {"service", {{"status", "pass"}, {"message", "Service is running"}}},
        {"redis", check_redis()}
    };

    std::string overall = "healthy";
    for (const auto& [name, check] : checks.items()) {
        if (check["status"] != "pass") {
            overall = "degraded";
        }
    }

    return {
        {"status", overall},
        {"service", config_.service_name},
        {"timestamp", util::current_iso8601()},
        {"version", config_.service_version},
        {"checks", checks},
        {"uptime", util::current_timestamp_ms() - start_ms_}
    };
}
