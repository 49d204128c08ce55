#include "http_command_transport.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

HttpCommandTransport::HttpCommandTransport(const std::string& url, const std::string& token,
                                           int connect_timeout_ms)
    : url_(url)
    , auth_header_("Authorization: Bearer " + token)
    , connect_timeout_ms_(connect_timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
}

HttpCommandTransport::~HttpCommandTransport() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpCommandTransport::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json HttpCommandTransport::execute(const std::vector<std::string>& command,
                                             std::chrono::milliseconds timeout) {
    if (command.empty()) {
        throw TransportError("Empty command");
    }

    std::string body = nlohmann::json(command).dump();
    std::string response_string;
    long status = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));

        struct curl_slist* headers = NULL;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, auth_header_.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl_);
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, NULL);
        curl_slist_free_all(headers);

        if (res != CURLE_OK) {
            if (res == CURLE_OPERATION_TIMEDOUT) {
                throw TransportError(command.front() + " timed out after " +
                                     std::to_string(timeout.count()) + "ms");
            }
            throw TransportError(command.front() + " failed: " + curl_easy_strerror(res));
        }
    }

    if (status < 200 || status >= 300) {
        throw TransportError("Redis command failed: " + std::to_string(status));
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw TransportError(std::string("Unparseable command response: ") + e.what());
    }

    if (!data.is_object()) {
        throw TransportError("Unexpected command response: " + response_string);
    }
    if (data.contains("error")) {
        throw TransportError(command.front() + " error: " + data["error"].dump());
    }
    if (!data.contains("result")) {
        throw TransportError("Command response has no result field");
    }

    spdlog::debug("{} -> {} bytes", command.front(), response_string.size());
    return data["result"];
}
