#pragma once

#include <string>

enum class EndpointKind {
    Http,   // REST command endpoint with bearer token
    Redis   // native protocol via redis++
};

struct Endpoint {
    EndpointKind kind;
    std::string url;
    std::string token;
};

// Throws std::invalid_argument for URLs that name no usable endpoint.
Endpoint parse_endpoint(const std::string& url);
