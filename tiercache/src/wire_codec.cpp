#include "wire_codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cctype>

namespace nlohmann {

void adl_serializer<std::chrono::system_clock::time_point>::to_json(
    json& j, const std::chrono::system_clock::time_point& tp) {
    j = json{{"__date__", util::format_iso8601_ms(tp)}};
}

void adl_serializer<std::chrono::system_clock::time_point>::from_json(
    const json& j, std::chrono::system_clock::time_point& tp) {
    if (!j.is_object() || !j.contains("__date__") || !j["__date__"].is_string()) {
        throw std::invalid_argument("expected a __date__ tagged value");
    }
    auto parsed = util::parse_iso8601(j["__date__"].get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("malformed __date__ value");
    }
    tp = *parsed;
}

} // namespace nlohmann

namespace wire {

namespace {

bool is_bigint_tag(const nlohmann::json& value) {
    return value.is_object() && value.size() == 1 && value.contains("__bigint__");
}

nlohmann::json parse_bigint(const nlohmann::json& tag) {
    const auto& digits = tag["__bigint__"];
    if (!digits.is_string()) {
        throw std::invalid_argument("__bigint__ payload must be a string");
    }

    const auto& str = digits.get_ref<const std::string&>();
    bool negative = !str.empty() && str[0] == '-';
    size_t start = negative ? 1 : 0;
    if (str.size() == start) {
        throw std::invalid_argument("empty __bigint__ payload");
    }
    for (size_t i = start; i < str.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
            throw std::invalid_argument("non-numeric __bigint__ payload: " + str);
        }
    }

    // std::stoll / std::stoull throw std::out_of_range past 64 bits
    if (negative) {
        return nlohmann::json(static_cast<int64_t>(std::stoll(str)));
    }
    return nlohmann::json(static_cast<uint64_t>(std::stoull(str)));
}

} // namespace

nlohmann::json tag_value(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::number_integer: {
            int64_t n = value.get<int64_t>();
            if (n > kMaxSafeInteger || n < -kMaxSafeInteger) {
                return nlohmann::json{{"__bigint__", std::to_string(n)}};
            }
            return value;
        }
        case nlohmann::json::value_t::number_unsigned: {
            uint64_t n = value.get<uint64_t>();
            if (n > static_cast<uint64_t>(kMaxSafeInteger)) {
                return nlohmann::json{{"__bigint__", std::to_string(n)}};
            }
            return value;
        }
        case nlohmann::json::value_t::array: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& item : value) {
                out.push_back(tag_value(item));
            }
            return out;
        }
        case nlohmann::json::value_t::object: {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& [key, item] : value.items()) {
                out[key] = tag_value(item);
            }
            return out;
        }
        default:
            return value;
    }
}

nlohmann::json untag_value(const nlohmann::json& value) {
    if (is_bigint_tag(value)) {
        return parse_bigint(value);
    }

    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) {
            out.push_back(untag_value(item));
        }
        return out;
    }

    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& [key, item] : value.items()) {
            out[key] = untag_value(item);
        }
        return out;
    }

    return value;
}

std::string encode_entry(const WireEntry& entry) {
    nlohmann::json envelope = {
        {"v", tag_value(entry.value)},
        {"c", entry.created_ms},
        {"t", entry.tags}
    };
    return envelope.dump();
}

std::optional<WireEntry> decode_entry(const std::string& text) {
    try {
        auto envelope = nlohmann::json::parse(text);
        if (!envelope.is_object() || !envelope.contains("v")) {
            spdlog::debug("Cache entry missing envelope fields");
            return std::nullopt;
        }

        WireEntry entry;
        entry.value = untag_value(envelope["v"]);
        entry.created_ms = envelope.value("c", int64_t{0});
        if (envelope.contains("t") && envelope["t"].is_array()) {
            entry.tags = envelope["t"].get<std::vector<std::string>>();
        }
        return entry;
    } catch (const std::exception& e) {
        spdlog::debug("Failed to decode cache entry: {}", e.what());
        return std::nullopt;
    }
}

} // namespace wire
