#pragma once

#include "command_transport.hpp"
#include <string>
#include <memory>
#include <sw/redis++/redis++.h>

// Native protocol channel. redis++ applies timeouts per connection, so the
// per-command timeout is fixed at construction.
class RedisCommandTransport : public CommandTransport {
public:
    RedisCommandTransport(const std::string& redis_url,
                          int connect_timeout_ms, int command_timeout_ms);

    nlohmann::json execute(const std::vector<std::string>& command,
                           std::chrono::milliseconds timeout) override;

    std::string describe() const override { return description_; }

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string description_;
};
