#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace chunkscribe {

struct HttpResponse {
    unsigned status = 0;
    std::string body;
};

/**
 * One-shot HTTP/1.1 client over Boost.Beast, TLS by default.
 *
 * Each request opens a fresh connection. The timeout bounds the whole
 * exchange (resolve, connect, handshake, write, read).
 */
class HttpClient {
public:
    explicit HttpClient(std::string host, uint16_t port = 443, bool use_ssl = true);
    virtual ~HttpClient() = default;

    // Returns false (after logging) when the exchange could not be completed.
    // A completed exchange with an error status still returns true.
    virtual bool send_request(const std::string& method,
                              const std::string& target,
                              const std::string& body,
                              const std::string& content_type,
                              HttpResponse& response);

    void set_timeout(int seconds);
    int timeout() const { return timeout_; }
    const std::string& host() const { return host_; }

    static std::string url_encode(const std::string& value);
    static std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

private:
    std::string host_;
    uint16_t port_;
    bool use_ssl_;
    int timeout_;
};

} // namespace chunkscribe
