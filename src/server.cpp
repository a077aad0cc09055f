#include "server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace nimproxy {

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "OK";
    }
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5 ||
        digits.find_first_not_of("0123456789") != std::string::npos)
        return false;
    int p = std::stoi(digits);
    if (p > 65535 || (p == 0 && !allow_ephemeral)) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// ── Socket response writer ────────────────────────────────────────────────────

namespace {

const char* const kCorsHeaders = "Access-Control-Allow-Origin: *\r\n";

bool send_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::send(fd, p, left, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    void send(int status, const std::string& content_type,
              const std::string& body) override {
        send_with_headers(status, {{"Content-Type", content_type}}, body);
    }

    void send_with_headers(int status, const std::vector<Header>& headers,
                           const std::string& body) {
        if (committed_) return;
        committed_ = true;
        std::string resp = status_line(status);
        for (const auto& h : headers)
            resp += h.first + ": " + h.second + "\r\n";
        resp += kCorsHeaders;
        resp += "Content-Length: " + std::to_string(body.size()) + "\r\n"
                "Connection: close\r\n\r\n" + body;
        alive_ = send_all(fd_, resp);
    }

    bool begin_stream(int status, const std::vector<Header>& headers) override {
        if (committed_) return false;
        committed_ = true;
        streaming_ = true;
        std::string head = status_line(status);
        for (const auto& h : headers)
            head += h.first + ": " + h.second + "\r\n";
        head += kCorsHeaders;
        head += "Transfer-Encoding: chunked\r\n\r\n";
        alive_ = send_all(fd_, head);
        return alive_;
    }

    bool write(const std::string& data) override {
        if (!streaming_ || !alive_) return false;
        if (data.empty()) return true;
        char size_line[24];
        std::snprintf(size_line, sizeof(size_line), "%zx\r\n", data.size());
        alive_ = send_all(fd_, size_line + data + "\r\n");
        return alive_;
    }

    void end() override {
        if (!streaming_ || finished_) return;
        finished_ = true;
        if (alive_) alive_ = send_all(fd_, "0\r\n\r\n");
    }

    bool committed() const override { return committed_; }

private:
    static std::string status_line(int status) {
        return "HTTP/1.1 " + std::to_string(status) + " " + status_reason(status) + "\r\n";
    }

    int  fd_;
    bool committed_ = false;
    bool streaming_ = false;
    bool finished_  = false;
    bool alive_     = true;
};

} // namespace

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, size_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port, true)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [&](const std::string& msg) {
        error = msg;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1)
        return fail("Invalid bind address: " + host);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0)
        return fail(std::string("bind failed: ") + std::strerror(errno));

    if (::listen(server_fd_, 64) != 0)
        return fail(std::string("listen failed: ") + std::strerror(errno));

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0)
        bound_port_ = ntohs(bound.sin_port);

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0)
        std::cerr << "[server] Failed to signal shutdown: " << std::strerror(errno) << "\n";
    if (thread_.joinable()) thread_.join();

    {
        std::unique_lock<std::mutex> lock(conn_mutex_);
        conn_cv_.wait(lock, [this] { return active_connections_ == 0; });
    }

    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout while reading the request
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            ++active_connections_;
        }
        std::thread([this, cfd]() { serve_connection(cfd); }).detach();
    }
}

void HttpServer::serve_connection(int fd) {
    handle_connection(fd);
    ::close(fd);
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (--active_connections_ == 0) conn_cv_.notify_all();
}

void HttpServer::handle_connection(int fd) const {
    SocketResponseWriter writer(fd);

    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            writer.send(400, "text/plain", "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string target, ver;
        if (!(ss >> req.method >> target >> ver)) {
            writer.send(400, "text/plain", "Bad request line");
            return;
        }
        req.path = target.substr(0, target.find('?'));
    }

    // Parse headers.
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    // Read body.
    size_t content_len = std::strtoul(req.header("content-length").c_str(), nullptr, 10);
    if (content_len > max_body_) {
        writer.send(413, "text/plain", "Payload too large");
        return;
    }
    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    // CORS preflight
    if (req.method == "OPTIONS") {
        std::vector<Header> headers = {
            {"Access-Control-Allow-Methods", "GET,HEAD,PUT,PATCH,POST,DELETE"},
            {"Vary", "Access-Control-Request-Headers"}
        };
        std::string requested = req.header("access-control-request-headers");
        if (!requested.empty())
            headers.emplace_back("Access-Control-Allow-Headers", requested);
        writer.send_with_headers(204, headers, "");
        return;
    }

    // Streaming can run far longer than a request read; block on writes only.
    struct timeval no_timeout{0, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &no_timeout, sizeof(no_timeout));

    try {
        handler_(req, writer);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler error on " << req.method << " " << req.path
                  << ": " << e.what() << "\n";
        if (!writer.committed()) {
            writer.send(500, "application/json",
                        R"({"error":{"message":"Internal server error","type":"server_error","code":500}})");
        }
        writer.end();
        return;
    }

    if (!writer.committed())
        writer.send(500, "text/plain", "No response");
    writer.end();
}

} // namespace nimproxy
