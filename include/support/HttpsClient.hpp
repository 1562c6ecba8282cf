#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace support {

struct HttpResponse {
    int status{0};
    std::string body;
};

// Blocking HTTPS GET over Boost.Beast. One connection per request.
class HttpsClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit HttpsClient(std::string host, std::string port = "443",
                         std::chrono::seconds timeout = std::chrono::seconds(10));

    // Throws qh::TransportError on resolve, connect, TLS or I/O failure.
    HttpResponse get(const std::string& target, const Headers& headers = {}) const;

    const std::string& host() const { return host_; }

private:
    std::string host_;
    std::string port_;
    std::chrono::seconds timeout_;
};

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& s);

}
