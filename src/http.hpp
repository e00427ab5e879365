#pragma once
#include <string>
#include <vector>
#include <utility>

namespace crancache {

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = transport failure (DNS, connect, TLS, I/O)
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;
};

// Linux: POSIX sockets + OpenSSL. Follows up to kMaxRedirects redirects.
class SocketHttpClient : public HttpClient {
public:
    static constexpr int kMaxRedirects = 5;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
};

// One-shot GET through a SocketHttpClient
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30);

} // namespace crancache
