#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int64_t Config::get_env_int(const char* name, int64_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    return util::parse_bool(val, default_val);
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL");
    cfg.key_prefix = get_env("CACHE_KEY_PREFIX", "tiercache:");
    cfg.redis_default_ttl_seconds = static_cast<int>(get_env_int("REDIS_DEFAULT_TTL_SECONDS", 300));
    cfg.redis_connect_timeout_ms = static_cast<int>(get_env_int("REDIS_CONNECT_TIMEOUT_MS", 5000));
    cfg.redis_command_timeout_ms = static_cast<int>(get_env_int("REDIS_COMMAND_TIMEOUT_MS", 2000));

    cfg.memory_max_entries = static_cast<int>(get_env_int("MEMORY_MAX_ENTRIES", 1000));
    cfg.memory_default_ttl_ms = get_env_int("MEMORY_DEFAULT_TTL_MS", 5 * 60 * 1000);
    cfg.memory_cleanup_interval_ms = get_env_int("MEMORY_CLEANUP_INTERVAL_MS", 60 * 1000);
    cfg.memory_auto_cleanup = get_env_bool("MEMORY_AUTO_CLEANUP", true);

    cfg.stale_while_revalidate = get_env_bool("STALE_WHILE_REVALIDATE", true);
    cfg.max_stale_age_ms = get_env_int("MAX_STALE_AGE_MS", 5 * 60 * 1000);
    cfg.background_workers = static_cast<int>(get_env_int("BACKGROUND_WORKERS", 2));
    cfg.max_pending_writes = get_env_int("MAX_PENDING_WRITES", 10000);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = static_cast<int>(get_env_int("LISTEN_PORT", 8090));

    cfg.service_name = get_env("SERVICE_NAME", "tiercache");
    cfg.service_version = get_env("SERVICE_VERSION", "1.0.0");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (memory_max_entries <= 0) {
        throw std::runtime_error("MEMORY_MAX_ENTRIES must be positive");
    }
    if (memory_default_ttl_ms <= 0) {
        throw std::runtime_error("MEMORY_DEFAULT_TTL_MS must be positive");
    }
    if (redis_default_ttl_seconds <= 0) {
        throw std::runtime_error("REDIS_DEFAULT_TTL_SECONDS must be positive");
    }
    if (key_prefix.empty()) {
        throw std::runtime_error("CACHE_KEY_PREFIX must not be empty");
    }
    if (background_workers <= 0) {
        throw std::runtime_error("BACKGROUND_WORKERS must be positive");
    }
    if (max_pending_writes <= 0) {
        throw std::runtime_error("MAX_PENDING_WRITES must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Memory: max_entries={}, default_ttl={}ms", memory_max_entries, memory_default_ttl_ms);
    spdlog::info("  Remote: {}", redis_url.empty() ? "not configured" : util::redact_url(redis_url));
    spdlog::info("  Stale-while-revalidate: {} (max stale age {}ms)",
                 stale_while_revalidate ? "on" : "off", max_stale_age_ms);
}
