#include "redis_command_transport.hpp"
#include "util.hpp"
#include <hiredis/hiredis.h>

namespace {

nlohmann::json reply_to_json(const redisReply* reply) {
    if (!reply) {
        return nullptr;
    }

    switch (reply->type) {
        case REDIS_REPLY_NIL:
            return nullptr;
        case REDIS_REPLY_INTEGER:
            return static_cast<int64_t>(reply->integer);
        case REDIS_REPLY_STRING:
        case REDIS_REPLY_STATUS:
            return std::string(reply->str, reply->len);
        case REDIS_REPLY_ARRAY: {
            nlohmann::json items = nlohmann::json::array();
            for (size_t i = 0; i < reply->elements; ++i) {
                items.push_back(reply_to_json(reply->element[i]));
            }
            return items;
        }
        case REDIS_REPLY_ERROR:
            throw TransportError(std::string(reply->str, reply->len));
        default:
            throw TransportError("Unsupported reply type " + std::to_string(reply->type));
    }
}

} // namespace

RedisCommandTransport::RedisCommandTransport(const std::string& redis_url,
                                             int connect_timeout_ms, int command_timeout_ms)
    : description_(util::redact_url(redis_url))
{
    sw::redis::ConnectionOptions opts(redis_url);
    opts.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
    opts.socket_timeout = std::chrono::milliseconds(command_timeout_ms);

    sw::redis::ConnectionPoolOptions pool_opts;
    pool_opts.size = 4;
    pool_opts.wait_timeout = std::chrono::milliseconds(command_timeout_ms);

    redis_ = std::make_shared<sw::redis::Redis>(opts, pool_opts);
}

nlohmann::json RedisCommandTransport::execute(const std::vector<std::string>& command,
                                              std::chrono::milliseconds /*timeout*/) {
    if (command.empty()) {
        throw TransportError("Empty command");
    }

    try {
        auto reply = redis_->command(command.begin(), command.end());
        return reply_to_json(reply.get());
    } catch (const sw::redis::TimeoutError& e) {
        throw TransportError(command.front() + " timed out: " + e.what());
    } catch (const sw::redis::Error& e) {
        throw TransportError(command.front() + " failed: " + e.what());
    }
}
