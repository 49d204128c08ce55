#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

// Timestamps travel as {"__date__": "<ISO-8601>"}
namespace nlohmann {
template <>
struct adl_serializer<std::chrono::system_clock::time_point> {
    static void to_json(json& j, const std::chrono::system_clock::time_point& tp);
    static void from_json(const json& j, std::chrono::system_clock::time_point& tp);
};
}

struct WireEntry {
    nlohmann::json value;
    int64_t created_ms = 0;
    std::vector<std::string> tags;
};

namespace wire {
    constexpr int64_t kMaxSafeInteger = 9007199254740991;  // 2^53 - 1

    // Wraps integers outside the safe range as {"__bigint__": "..."}
    nlohmann::json tag_value(const nlohmann::json& value);
    // Reverses tag_value; throws std::invalid_argument on a malformed tag
    nlohmann::json untag_value(const nlohmann::json& value);

    std::string encode_entry(const WireEntry& entry);
    std::optional<WireEntry> decode_entry(const std::string& text);
}
