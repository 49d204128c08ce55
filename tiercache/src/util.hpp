#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();

    // ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:30:00.250Z
    std::string format_iso8601_ms(std::chrono::system_clock::time_point tp);
    std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& str);

    int64_t to_unix_ms(std::chrono::system_clock::time_point tp);

    // Best-effort translation of a key regex into a KEYS glob.
    // Returns nullopt when the regex uses constructs a glob cannot express.
    std::optional<std::string> regex_to_glob(const std::string& pattern);

    std::string redact_url(const std::string& url);
    bool parse_bool(const std::string& str, bool default_val);
}
