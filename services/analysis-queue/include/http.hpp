#pragma once
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Throws std::runtime_error when the request cannot be performed at all.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
