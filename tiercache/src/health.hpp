#pragma once

#include "cache_provider.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>

class HealthCheck {
public:
    HealthCheck(CacheProvider& provider, const Config& config);

    nlohmann::json get_status();

private:
    CacheProvider& provider_;
    const Config& config_;
    int64_t start_ms_;

    nlohmann::json check_redis();
};
