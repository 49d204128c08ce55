#include "endpoint.hpp"
#include <curl/curl.h>
#include <memory>
#include <optional>
#include <stdexcept>

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

std::optional<std::string> url_part(CURLU* handle, CURLUPart what) {
    char* part = nullptr;
    if (curl_url_get(handle, what, &part, 0) != CURLUE_OK || !part) {
        return std::nullopt;
    }
    std::string result(part);
    curl_free(part);
    return result;
}

} // namespace

Endpoint parse_endpoint(const std::string& url) {
    std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
    if (!handle) {
        throw std::runtime_error("Failed to allocate CURLU handle");
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        throw std::invalid_argument(std::string("Malformed cache URL: ") + curl_url_strerror(rc));
    }

    auto scheme = url_part(handle.get(), CURLUPART_SCHEME).value_or("");
    auto host = url_part(handle.get(), CURLUPART_HOST).value_or("");
    auto user = url_part(handle.get(), CURLUPART_USER).value_or("");
    auto password = url_part(handle.get(), CURLUPART_PASSWORD).value_or("");

    if (host.empty()) {
        throw std::invalid_argument("Cache URL has no host");
    }

    if (scheme == "http" || scheme == "https") {
        Endpoint endpoint;
        endpoint.kind = EndpointKind::Http;
        endpoint.token = password.empty() ? user : password;

        // Credentials travel in the Authorization header, not the URL
        curl_url_set(handle.get(), CURLUPART_USER, nullptr, 0);
        curl_url_set(handle.get(), CURLUPART_PASSWORD, nullptr, 0);
        endpoint.url = url_part(handle.get(), CURLUPART_URL).value_or(scheme + "://" + host);
        return endpoint;
    }

    if (scheme == "redis" || scheme == "rediss" || scheme == "tcp") {
        if (host.find("upstash") != std::string::npos) {
            Endpoint endpoint;
            endpoint.kind = EndpointKind::Http;
            endpoint.url = "https://" + host;
            endpoint.token = password;
            return endpoint;
        }

        Endpoint endpoint;
        endpoint.kind = EndpointKind::Redis;
        endpoint.url = url;
        endpoint.token = password;
        return endpoint;
    }

    throw std::invalid_argument("Unsupported cache URL scheme: " + scheme);
}
