#include "remote_cache.hpp"
#include "endpoint.hpp"
#include "http_command_transport.hpp"
#include "redis_command_transport.hpp"
#include "wire_codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

std::shared_ptr<CommandTransport> make_transport(const RemoteCacheOptions& options) {
    Endpoint endpoint = parse_endpoint(options.url);

    if (endpoint.kind == EndpointKind::Http) {
        if (endpoint.token.empty()) {
            throw std::invalid_argument("REST cache URL carries no token");
        }
        return std::make_shared<HttpCommandTransport>(endpoint.url, endpoint.token,
                                                      options.connect_timeout_ms);
    }

    return std::make_shared<RedisCommandTransport>(endpoint.url,
                                                   options.connect_timeout_ms,
                                                   options.command_timeout_ms);
}

} // namespace

std::string to_string(RemoteState state) {
    switch (state) {
        case RemoteState::Unconfigured: return "unconfigured";
        case RemoteState::Connecting: return "connecting";
        case RemoteState::Connected: return "connected";
        case RemoteState::Unavailable: return "unavailable";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const RemoteCacheStats& stats) {
    j = nlohmann::json{
        {"connected", stats.connected},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"errors", stats.errors}
    };
    if (stats.last_error) j["last_error"] = *stats.last_error;
    if (stats.last_connected_at) j["last_connected_at"] = *stats.last_connected_at;
}

RemoteCache::RemoteCache(RemoteCacheOptions options)
    : RemoteCache(std::move(options), nullptr) {}

RemoteCache::RemoteCache(RemoteCacheOptions options, std::shared_ptr<CommandTransport> transport)
    : options_(std::move(options))
    , transport_(std::move(transport))
    , state_(RemoteState::Unconfigured)
{
    if (transport_ || !options_.url.empty()) {
        state_ = RemoteState::Connecting;
    }
}

bool RemoteCache::connect() {
    std::lock_guard<std::mutex> connect_lock(connect_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == RemoteState::Unconfigured) {
            spdlog::debug("[RemoteCache] No REDIS_URL configured, running in memory-only mode");
            return false;
        }
        if (state_ != RemoteState::Connecting) {
            return state_ == RemoteState::Connected;
        }
    }

    try {
        if (!transport_) {
            transport_ = make_transport(options_);
        }

        auto reply = transport_->execute({"PING"}, std::chrono::milliseconds(options_.connect_timeout_ms));
        if (!reply.is_string() || reply.get<std::string>() != "PONG") {
            throw TransportError("Unexpected PING reply: " + reply.dump());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        state_ = RemoteState::Connected;
        stats_.connected = true;
        stats_.last_connected_at = util::current_timestamp_ms();
        spdlog::info("[RemoteCache] Connected to {}", transport_->describe());
        return true;

    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = RemoteState::Unavailable;
        stats_.errors++;
        stats_.last_error = e.what();
        spdlog::warn("[RemoteCache] Connection failed: {}", e.what());
        return false;
    }
}

bool RemoteCache::is_available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == RemoteState::Connected;
}

RemoteState RemoteCache::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

nlohmann::json RemoteCache::execute(const std::vector<std::string>& command) {
    return transport_->execute(command, std::chrono::milliseconds(options_.command_timeout_ms));
}

void RemoteCache::record_error(const std::string& op, const std::exception& e) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.errors++;
        stats_.last_error = e.what();
    }
    spdlog::error("[RemoteCache] {} error: {}", op, e.what());
}

void RemoteCache::record_read(bool hit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hit) {
        stats_.hits++;
    } else {
        stats_.misses++;
    }
}

std::optional<nlohmann::json> RemoteCache::get(const std::string& key) {
    auto lookup = get_with_meta(key);
    return lookup.value;
}

RemoteLookup RemoteCache::get_with_meta(const std::string& key) {
    RemoteLookup result;
    if (!is_available()) {
        return result;
    }

    nlohmann::json reply;
    try {
        reply = execute({"GET", full_key(key)});
    } catch (const std::exception& e) {
        record_error("GET", e);
        return result;
    }

    if (reply.is_null()) {
        record_read(false);
        return result;
    }

    auto entry = wire::decode_entry(reply.is_string() ? reply.get<std::string>() : reply.dump());
    if (!entry) {
        record_read(false);
        return result;
    }

    record_read(true);
    result.value = std::move(entry->value);
    result.hit = true;
    result.age = std::chrono::milliseconds(
        std::max<int64_t>(0, util::current_timestamp_ms() - entry->created_ms));
    result.tags = std::move(entry->tags);
    return result;
}

bool RemoteCache::set(const std::string& key, const nlohmann::json& value,
                      std::optional<int> ttl_seconds,
                      const std::vector<std::string>& tags) {
    if (!is_available()) {
        return false;
    }

    int ttl = std::max(1, ttl_seconds.value_or(options_.default_ttl_seconds));
    std::string fk = full_key(key);

    try {
        WireEntry entry;
        entry.value = value;
        entry.created_ms = util::current_timestamp_ms();
        entry.tags = tags;

        execute({"SET", fk, wire::encode_entry(entry), "EX", std::to_string(ttl)});

        for (const auto& tag : tags) {
            std::string tk = tag_key(tag);
            execute({"SADD", tk, fk});
            execute({"EXPIRE", tk, std::to_string(ttl * 2)});
        }
        return true;

    } catch (const std::exception& e) {
        record_error("SET", e);
        return false;
    }
}

bool RemoteCache::remove(const std::string& key) {
    if (!is_available()) {
        return false;
    }

    try {
        execute({"DEL", full_key(key)});
        return true;
    } catch (const std::exception& e) {
        record_error("DEL", e);
        return false;
    }
}

bool RemoteCache::has(const std::string& key) {
    if (!is_available()) {
        return false;
    }

    try {
        auto reply = execute({"EXISTS", full_key(key)});
        return reply.is_number_integer() && reply.get<int64_t>() == 1;
    } catch (const std::exception& e) {
        record_error("EXISTS", e);
        return false;
    }
}

int64_t RemoteCache::ttl(const std::string& key) {
    if (!is_available()) {
        return -1;
    }

    try {
        auto reply = execute({"TTL", full_key(key)});
        return reply.is_number_integer() ? reply.get<int64_t>() : -1;
    } catch (const std::exception& e) {
        record_error("TTL", e);
        return -1;
    }
}

size_t RemoteCache::invalidate_by_tag(const std::string& tag) {
    if (!is_available()) {
        return 0;
    }

    try {
        std::string tk = tag_key(tag);
        auto members = execute({"SMEMBERS", tk});
        if (!members.is_array() || members.empty()) {
            return 0;
        }

        for (const auto& member : members) {
            if (member.is_string()) {
                execute({"DEL", member.get<std::string>()});
            }
        }
        execute({"DEL", tk});

        return members.size();
    } catch (const std::exception& e) {
        record_error("invalidate_by_tag", e);
        return 0;
    }
}

size_t RemoteCache::delete_by_pattern(const std::string& glob,
                                      const std::function<bool(const std::string&)>& filter) {
    if (!is_available()) {
        return 0;
    }

    try {
        auto keys = execute({"KEYS", options_.key_prefix + glob});
        if (!keys.is_array() || keys.empty()) {
            return 0;
        }

        size_t deleted = 0;
        for (const auto& key : keys) {
            if (!key.is_string()) continue;

            auto name = key.get<std::string>();
            if (is_tag_key(name)) continue;
            if (filter && !filter(name.substr(options_.key_prefix.size()))) continue;

            execute({"DEL", name});
            deleted++;
        }
        return deleted;
    } catch (const std::exception& e) {
        record_error("delete_by_pattern", e);
        return 0;
    }
}

size_t RemoteCache::clear() {
    if (!is_available()) {
        return 0;
    }

    try {
        auto keys = execute({"KEYS", options_.key_prefix + "*"});
        if (!keys.is_array()) {
            return 0;
        }

        for (const auto& key : keys) {
            if (key.is_string()) {
                execute({"DEL", key.get<std::string>()});
            }
        }
        spdlog::info("[RemoteCache] Cleared {} keys under {}", keys.size(), options_.key_prefix);
        return keys.size();
    } catch (const std::exception& e) {
        record_error("clear", e);
        return 0;
    }
}

bool RemoteCache::is_tag_key(const std::string& key) const {
    std::string tag_prefix = options_.key_prefix + "tag:";
    return key.compare(0, tag_prefix.size(), tag_prefix) == 0;
}

RemoteCacheStats RemoteCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}
