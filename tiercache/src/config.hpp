#pragma once

#include <string>
#include <cstdlib>
#include <cstdint>

struct Config {
    // Tier 2
    std::string redis_url;
    std::string key_prefix;
    int redis_default_ttl_seconds;
    int redis_connect_timeout_ms;
    int redis_command_timeout_ms;

    // Tier 1
    int memory_max_entries;
    int64_t memory_default_ttl_ms;
    int64_t memory_cleanup_interval_ms;
    bool memory_auto_cleanup;

    // Orchestrator
    bool stale_while_revalidate;
    int64_t max_stale_age_ms;
    int background_workers;
    int64_t max_pending_writes;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string service_version;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int64_t get_env_int(const char* name, int64_t default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
