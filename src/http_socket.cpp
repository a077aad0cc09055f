// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

namespace nimproxy {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("invalid URL: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Returns an empty string on success, otherwise what went wrong.
    std::string connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0)
            return "getaddrinfo " + url.host + ": " + gai_strerror(gai);

        bool connected = false;
        int last_errno = 0;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_errno = err;
                    }
                } else {
                    last_errno = (rc == 0) ? ETIMEDOUT : errno;
                }
            } else {
                last_errno = errno;
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected)
            return "connect " + url.host + ":" + url.port + ": " + std::strerror(last_errno);

        // Use full timeout for TLS handshake and headers, then switch to
        // 1-second slices so abort-flag checks work during body streaming.
        set_socket_timeout(timeout_secs);
        if (url.tls) {
            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return "SSL_CTX_new failed";
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return "SSL_new failed";
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                return std::string("TLS handshake with ") + url.host + " failed: " + buf;
            }
        }
        return {};
    }

    void use_polling_timeout() { set_socket_timeout(1); }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on unrecoverable error.
    // EAGAIN (timeout slice expiry) loops back so the caller can check abort.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (g_socket_abort_flag &&
                g_socket_abort_flag->load(std::memory_order_relaxed))
                return -1;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false if the connection ended before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct BodyFraming {
    bool   chunked        = false;
    bool   has_length     = false; // neither chunked nor length = read to close
    size_t content_length = 0;
};

// Parse status line + headers. Returns 0 if no valid response head arrived.
static long parse_response_headers(Connection& conn, std::string& leftover,
                                    BodyFraming& framing) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return 0;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return 0;
    long status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (status < 100 || status > 999) return 0;

    std::string line;
    while (true) {
        if (!read_line(conn, leftover, line)) return 0;
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            framing.chunked = (value.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            framing.has_length = true;
            framing.content_length = std::strtoul(value.c_str(), nullptr, 10);
        }
    }
    return status;
}

enum class BodyEnd {
    Complete,  // final chunk, full Content-Length, or close-delimited EOF
    Stopped,   // sink asked to stop
    Truncated  // connection ended or failed before the body was complete
};

// Hand body bytes to sink as they arrive; dechunks if needed.
static BodyEnd pump_body(Connection& conn, std::string& leftover,
                         const BodyFraming& framing, const RawChunkCallback& sink) {
    // Deliver exactly n bytes, or everything until close when n is npos
    auto pass = [&](size_t n) -> BodyEnd {
        while (n > 0) {
            if (!leftover.empty()) {
                size_t take = std::min(n, leftover.size());
                if (!sink(leftover.data(), take)) return BodyEnd::Stopped;
                leftover.erase(0, take);
                if (n != std::string::npos) n -= take;
                continue;
            }
            char buf[4096];
            ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
            if (got == 0 && n == std::string::npos) return BodyEnd::Complete;
            if (got <= 0) return BodyEnd::Truncated;
            if (!sink(buf, static_cast<size_t>(got))) return BodyEnd::Stopped;
            if (n != std::string::npos) n -= static_cast<size_t>(got);
        }
        return BodyEnd::Complete;
    };

    if (!framing.chunked)
        return pass(framing.has_length ? framing.content_length : std::string::npos);

    std::string line;
    while (true) {
        if (!read_line(conn, leftover, line)) return BodyEnd::Truncated;
        // Chunk size is hex, may have extensions after ';'
        char* end = nullptr;
        size_t chunk_size = std::strtoul(line.c_str(), &end, 16);
        if (end == line.c_str()) return BodyEnd::Truncated;
        if (chunk_size == 0) return BodyEnd::Complete;

        BodyEnd result = pass(chunk_size);
        if (result != BodyEnd::Complete) return result;
        if (!read_line(conn, leftover, line)) return BodyEnd::Truncated; // trailing \r\n
    }
}

// Status 0 + error for a body that ended early
static void mark_truncated(HttpResponse& resp) {
    resp.status_code = 0;
    resp.error = "connection closed mid-body";
}

// ── Core request executor ──────────────────────────────────────

// Send the request and read the response head. On failure, returns a
// response with status 0 and error set.
static HttpResponse open_exchange(Connection& conn, std::string& leftover,
                                  BodyFraming& framing,
                                  const std::string& url_str,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_secs) {
    HttpResponse resp;
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::exception& e) {
        resp.error = e.what();
        return resp;
    }

    resp.error = conn.connect(url, timeout_secs);
    if (!resp.error.empty()) return resp;

    std::string request = build_request(url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.error = "failed to send request to " + url.host;
        return resp;
    }

    resp.status_code = parse_response_headers(conn, leftover, framing);
    if (resp.status_code == 0)
        resp.error = "no valid HTTP response from " + url.host;
    conn.use_polling_timeout();
    return resp;
}

static HttpResponse collect(Connection& conn, std::string& leftover,
                            const BodyFraming& framing, HttpResponse resp) {
    BodyEnd result = pump_body(conn, leftover, framing,
        [&resp](const char* data, size_t len) {
            resp.body.append(data, len);
            return true;
        });
    if (result == BodyEnd::Truncated) mark_truncated(resp);
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    Connection conn;
    std::string leftover;
    BodyFraming framing;
    HttpResponse resp = open_exchange(conn, leftover, framing, url, body,
                                      headers, timeout_seconds);
    if (resp.status_code == 0) return resp;
    return collect(conn, leftover, framing, std::move(resp));
}

// Default base-class implementation delegates to http_stream_post_raw.
HttpResponse HttpClient::stream_post_raw(const std::string& url,
                                          const std::string& body,
                                          const std::vector<Header>& headers,
                                          RawChunkCallback callback,
                                          long timeout_seconds) {
    return http_stream_post_raw(url, body, headers, std::move(callback), timeout_seconds);
}

HttpResponse http_stream_post_raw(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   RawChunkCallback callback,
                                   long timeout_seconds) {
    Connection conn;
    std::string leftover;
    BodyFraming framing;
    HttpResponse resp = open_exchange(conn, leftover, framing, url, body,
                                      headers, timeout_seconds);
    if (resp.status_code == 0) return resp;

    if (resp.status_code < 200 || resp.status_code >= 300)
        return collect(conn, leftover, framing, std::move(resp));

    if (pump_body(conn, leftover, framing, callback) == BodyEnd::Truncated)
        mark_truncated(resp);
    return resp;
}

} // namespace nimproxy

#endif // __linux__
