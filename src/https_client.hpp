#pragma once
#include <string>

namespace agentgate {

struct HttpsResponse {
    int status = 0;
    std::string body;
    std::string error;      // transport failure, empty when a response arrived
    bool ok() const { return status >= 200 && status < 300; }
};

// HTTPS POST through httplib + OpenSSL with certificate verification on.
HttpsResponse https_post(
    const std::string& host,
    const std::string& path,
    const std::string& body,
    const std::string& content_type = "application/json",
    int timeout_ms = 30000
);

// application/x-www-form-urlencoded encoding of one value
std::string form_encode(const std::string& value);

} // namespace agentgate
