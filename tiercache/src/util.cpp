#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t to_unix_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count();
}

std::string format_iso8601_ms(std::chrono::system_clock::time_point tp) {
    int64_t ms = to_unix_ms(tp);
    int64_t secs = ms / 1000;
    int64_t frac = ms % 1000;
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }

    std::time_t itt = static_cast<std::time_t>(secs);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%T")
       << '.' << std::setw(3) << std::setfill('0') << frac << 'Z';
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& str) {
    std::tm tm_utc{};
    std::istringstream ss(str);
    ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int64_t millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits += static_cast<char>(ss.get());
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        digits.resize(3, '0');
        millis = std::stoll(digits);
    }

    if (ss.get() != 'Z') {
        return std::nullopt;
    }

    std::time_t secs = timegm(&tm_utc);
    return std::chrono::system_clock::time_point(
        std::chrono::seconds(secs) + std::chrono::milliseconds(millis));
}

namespace {

bool ends_with_wildcard(const std::string& glob) {
    size_t n = glob.size();
    return n > 0 && glob[n - 1] == '*' && (n < 2 || glob[n - 2] != '\\');
}

} // namespace

std::optional<std::string> regex_to_glob(const std::string& pattern) {
    std::string body = pattern;
    bool anchored_start = !body.empty() && body.front() == '^';
    if (anchored_start) {
        body.erase(0, 1);
    }
    bool anchored_end = !body.empty() && body.back() == '$' &&
                        (body.size() < 2 || body[body.size() - 2] != '\\');
    if (anchored_end) {
        body.pop_back();
    }

    std::string glob;
    if (!anchored_start) glob += '*';

    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\\') {
            if (i + 1 >= body.size()) return std::nullopt;
            char next = body[++i];
            if (std::isalnum(static_cast<unsigned char>(next))) {
                // \d, \w and friends have no glob equivalent
                return std::nullopt;
            }
            if (next == '*' || next == '?' || next == '[' || next == ']') {
                glob += '\\';
            }
            glob += next;
        } else if (c == '.') {
            if (i + 1 < body.size() && body[i + 1] == '*') {
                if (!ends_with_wildcard(glob)) glob += '*';
                ++i;
            } else {
                glob += '?';
            }
        } else if (std::string("*?+()[]{}|^$").find(c) != std::string::npos) {
            // Quantifiers not attached to '.' have no glob form
            return std::nullopt;
        } else {
            glob += c;
        }
    }

    if (!anchored_end && !ends_with_wildcard(glob)) glob += '*';
    return glob;
}

std::string redact_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    size_t at = url.find('@');
    if (scheme_end == std::string::npos || at == std::string::npos || at < scheme_end) {
        return url;
    }

    size_t colon = url.find(':', scheme_end + 3);
    if (colon == std::string::npos || colon > at) {
        return url.substr(0, scheme_end + 3) + "***" + url.substr(at);
    }
    return url.substr(0, colon + 1) + "***" + url.substr(at);
}

bool parse_bool(const std::string& str, bool default_val) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return default_val;
}

} // namespace util
