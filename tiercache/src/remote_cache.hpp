#pragma once

#include "command_transport.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

struct RemoteCacheOptions {
    std::string url;                    // empty => memory-only
    std::string key_prefix = "tiercache:";
    int default_ttl_seconds = 300;
    int connect_timeout_ms = 5000;
    int command_timeout_ms = 2000;
};

enum class RemoteState {
    Unconfigured,
    Connecting,
    Connected,
    Unavailable
};

std::string to_string(RemoteState state);

struct RemoteCacheStats {
    bool connected = false;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t errors = 0;
    std::optional<std::string> last_error;
    std::optional<int64_t> last_connected_at;  // unix ms
};

void to_json(nlohmann::json& j, const RemoteCacheStats& stats);

struct RemoteLookup {
    std::optional<nlohmann::json> value;
    bool hit = false;
    std::chrono::milliseconds age{0};
    std::vector<std::string> tags;
};

/**
 * Tier 2: shared cache behind a textual command channel.
 *
 * Every operation absorbs infrastructure failures: reads report a miss,
 * writes report false, counts report 0. Failures are counted and the last
 * one kept for stats.
 */
class RemoteCache {
public:
    explicit RemoteCache(RemoteCacheOptions options);
    // Uses the given channel instead of one built from options.url
    RemoteCache(RemoteCacheOptions options, std::shared_ptr<CommandTransport> transport);

    // Probes the endpoint once; later calls return the settled result.
    bool connect();

    bool is_available() const;
    RemoteState state() const;

    std::optional<nlohmann::json> get(const std::string& key);
    RemoteLookup get_with_meta(const std::string& key);
    bool set(const std::string& key, const nlohmann::json& value,
             std::optional<int> ttl_seconds = std::nullopt,
             const std::vector<std::string>& tags = {});
    bool remove(const std::string& key);
    bool has(const std::string& key);
    int64_t ttl(const std::string& key);

    size_t invalidate_by_tag(const std::string& tag);

    // Deletes entries whose key matches the glob (relative to the prefix).
    // Tag sets are never matched. When a filter is given, only keys it
    // accepts are deleted; it sees the key without the prefix.
    size_t delete_by_pattern(const std::string& glob,
                             const std::function<bool(const std::string&)>& filter = {});
    // Deletes every key under the prefix, tag sets included
    size_t clear();

    RemoteCacheStats get_stats() const;
    const RemoteCacheOptions& options() const { return options_; }

private:
    RemoteCacheOptions options_;
    std::shared_ptr<CommandTransport> transport_;

    mutable std::mutex mutex_;
    std::mutex connect_mutex_;
    RemoteState state_;
    RemoteCacheStats stats_;

    nlohmann::json execute(const std::vector<std::string>& command);
    void record_error(const std::string& op, const std::exception& e);
    void record_read(bool hit);
    std::string full_key(const std::string& key) const { return options_.key_prefix + key; }
    std::string tag_key(const std::string& tag) const { return options_.key_prefix + "tag:" + tag; }
    bool is_tag_key(const std::string& key) const;
};
