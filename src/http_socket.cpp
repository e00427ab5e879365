// Linux HTTP/HTTPS GET client using POSIX sockets + OpenSSL.
// OpenSSL 1.1+ initialises itself, so there is no global setup step.
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

namespace crancache {

// ── URLs ───────────────────────────────────────────────────────

struct Url {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target; // path + query, always starts with '/'
};

static std::optional<Url> parse_url(const std::string& text) {
    size_t scheme_end = text.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    std::string scheme = to_lower(text.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") return std::nullopt;

    Url url;
    url.tls = (scheme == "https");

    size_t authority_start = scheme_end + 3;
    size_t target_start = text.find_first_of("/?", authority_start);
    std::string authority = text.substr(authority_start,
        target_start == std::string::npos ? std::string::npos : target_start - authority_start);
    if (authority.empty()) return std::nullopt;

    if (target_start == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(target_start);
        if (url.target[0] == '?') url.target.insert(0, "/");
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    } else {
        url.host = authority;
        url.port = url.tls ? "443" : "80";
    }
    return url;
}

// Resolve a Location header against the URL that produced it.
static std::string resolve_location(const Url& base, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;

    std::string origin = std::string(base.tls ? "https" : "http") + "://" + base.host;
    bool default_port = (base.tls && base.port == "443") || (!base.tls && base.port == "80");
    if (!default_port) origin += ":" + base.port;

    if (!location.empty() && location[0] == '/') return origin + location;

    // Relative to the current directory
    std::string dir = base.target.substr(0, base.target.find('?'));
    dir = dir.substr(0, dir.rfind('/') + 1);
    return origin + dir + location;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const Url& url, long timeout_secs) {
        if (!connect_tcp(url, timeout_secs)) return false;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (!url.tls) return true;

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI
        SSL_set1_host(ssl_, url.host.c_str());           // hostname check

        if (SSL_connect(ssl_) != 1) {
            ERR_clear_error();
            return false;
        }
        return true;
    }

    // >0 bytes read, 0 on orderly close, -1 on error or timeout.
    ssize_t receive(char* buf, size_t len) {
        for (;;) {
            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                // Servers that close without close_notify look like a syscall EOF.
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0;
                return -1;
            }
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EINTR) continue;
            return -1;
        }
    }

    bool send_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n;
            if (ssl_) {
                int w = SSL_write(ssl_, p, static_cast<int>(left));
                if (w <= 0) {
                    int err = SSL_get_error(ssl_, w);
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    return false;
                }
                n = w;
            } else {
                n = ::send(fd_, p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool connect_tcp(const Url& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        for (auto* ai = res; ai; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            if (connect_with_timeout(fd, ai, timeout_secs)) {
                fd_ = fd;
                break;
            }
            ::close(fd);
        }
        freeaddrinfo(res);
        return fd_ >= 0;
    }

    // Non-blocking connect so the timeout covers the handshake too.
    static bool connect_with_timeout(int fd, const struct addrinfo* ai, long timeout_secs) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        bool ok = false;
        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            ok = true;
        } else if (errno == EINPROGRESS) {
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd, &wset);
            struct timeval tv{timeout_secs, 0};
            if (select(fd + 1, nullptr, &wset, nullptr, &tv) > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                ok = (err == 0);
            }
        }

        fcntl(fd, F_SETFL, flags);
        return ok;
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

// ── Response reading ───────────────────────────────────────────

struct ResponseHead {
    long status = 0;
    bool chunked = false;
    std::optional<size_t> content_length;
    std::string location;
};

class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    bool read_head(ResponseHead& head) {
        std::string status_line;
        if (!read_line(status_line)) return false;

        // "HTTP/1.1 200 OK"
        size_t sp = status_line.find(' ');
        if (sp == std::string::npos || status_line.size() < sp + 4) return false;
        head.status = std::strtol(status_line.substr(sp + 1, 3).c_str(), nullptr, 10);
        if (head.status < 100) return false;

        std::string line;
        while (read_line(line) && !line.empty()) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name  = to_lower(trim(line.substr(0, colon)));
            std::string value = trim(line.substr(colon + 1));

            if (name == "transfer-encoding") {
                head.chunked = to_lower(value).find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                char* end = nullptr;
                unsigned long long n = std::strtoull(value.c_str(), &end, 10);
                if (end != value.c_str()) head.content_length = static_cast<size_t>(n);
            } else if (name == "location") {
                head.location = value;
            }
        }
        return true;
    }

    std::string read_body(const ResponseHead& head) {
        std::string body;
        if (head.chunked) {
            std::string size_line;
            while (read_line(size_line)) {
                // Hex size, optionally followed by ";extensions"
                size_t chunk = std::strtoul(size_line.c_str(), nullptr, 16);
                if (chunk == 0) break;
                if (!take(chunk, body)) break;
                std::string crlf;
                read_line(crlf);
            }
        } else if (head.content_length) {
            take(*head.content_length, body);
        } else {
            body = std::move(pending_);
            pending_.clear();
            char buf[4096];
            ssize_t n;
            while ((n = conn_.receive(buf, sizeof(buf))) > 0)
                body.append(buf, static_cast<size_t>(n));
        }
        return body;
    }

private:
    bool fill() {
        char buf[4096];
        ssize_t n = conn_.receive(buf, sizeof(buf));
        if (n <= 0) return false;
        pending_.append(buf, static_cast<size_t>(n));
        return true;
    }

    // CRLF- or LF-terminated line without its terminator.
    bool read_line(std::string& line) {
        size_t pos;
        while ((pos = pending_.find('\n')) == std::string::npos) {
            if (!fill()) return false;
        }
        line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    bool take(size_t n, std::string& out) {
        while (pending_.size() < n) {
            if (!fill()) {
                out += pending_;
                pending_.clear();
                return false;
            }
        }
        out.append(pending_, 0, n);
        pending_.erase(0, n);
        return true;
    }

    Connection& conn_;
    std::string pending_;
};

// ── Request execution ──────────────────────────────────────────

static std::string build_get_request(const Url& url, const std::vector<Header>& headers) {
    std::string req = "GET " + url.target + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_user_agent = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (to_lower(h.first) == "user-agent") has_user_agent = true;
    }
    if (!has_user_agent) req += "User-Agent: crancache/1.0\r\n";
    req += "Accept-Encoding: identity\r\n";
    req += "Connection: close\r\n\r\n";
    return req;
}

static bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

static HttpResponse fetch_once(const Url& url, const std::vector<Header>& headers,
                               long timeout_secs, std::string& location) {
    Connection conn;
    if (!conn.open(url, timeout_secs)) return {};
    if (!conn.send_all(build_get_request(url, headers))) return {};

    ResponseReader reader(conn);
    ResponseHead head;
    if (!reader.read_head(head)) return {};

    HttpResponse resp;
    resp.status_code = head.status;
    location = head.location;
    resp.body = reader.read_body(head);
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    std::string current = url;
    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        auto parsed = parse_url(current);
        if (!parsed) return {};

        std::string location;
        HttpResponse resp = fetch_once(*parsed, headers, timeout_seconds, location);
        if (!is_redirect(resp.status_code) || location.empty()) return resp;

        current = resolve_location(*parsed, location);
    }
    return {}; // redirect loop
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    SocketHttpClient client;
    return client.get(url, headers, timeout_seconds);
}

} // namespace crancache

#endif // __linux__
