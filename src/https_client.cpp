#include "https_client.hpp"
#include <httplib.h>
#include <cctype>

namespace agentgate {

HttpsResponse https_post(
    const std::string& host,
    const std::string& path,
    const std::string& body,
    const std::string& content_type,
    int timeout_ms)
{
    HttpsResponse resp;

    int sec = timeout_ms / 1000;
    int usec = (timeout_ms % 1000) * 1000;

    httplib::SSLClient cli(host, 443);
    cli.set_connection_timeout(sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);
    cli.enable_server_certificate_verification(true);

    auto res = cli.Post(path, body, content_type);
    if (!res) {
        resp.error = "HTTPS request to " + host + " failed: " + httplib::to_string(res.error());
        return resp;
    }
    resp.status = res->status;
    resp.body = res->body;
    return resp;
}

std::string form_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0f];
        }
    }
    return out;
}

} // namespace agentgate
