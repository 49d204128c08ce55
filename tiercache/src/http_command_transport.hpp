#pragma once

#include "command_transport.hpp"
#include <string>
#include <mutex>
#include <curl/curl.h>

class HttpCommandTransport : public CommandTransport {
public:
    HttpCommandTransport(const std::string& url, const std::string& token,
                         int connect_timeout_ms = 5000);
    ~HttpCommandTransport() override;

    HttpCommandTransport(const HttpCommandTransport&) = delete;
    HttpCommandTransport& operator=(const HttpCommandTransport&) = delete;

    nlohmann::json execute(const std::vector<std::string>& command,
                           std::chrono::milliseconds timeout) override;

    std::string describe() const override { return url_; }

private:
    std::string url_;
    std::string auth_header_;
    int connect_timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;  // one easy handle, one request at a time

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
