#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Raised for any failed round trip: network, timeout, HTTP status,
// error reply or malformed body.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * A channel that executes one textual key-value command, e.g.
 * ["SET", "ns:key", "<entry>", "EX", "300"], and returns the command's
 * result as JSON (string, integer, array or null).
 */
class CommandTransport {
public:
    virtual ~CommandTransport() = default;

    virtual nlohmann::json execute(const std::vector<std::string>& command,
                                   std::chrono::milliseconds timeout) = 0;

    virtual std::string describe() const = 0;
};
