#pragma once
#include "http.hpp"
#include <string>
#include <vector>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstddef>
#include <cstdint>

namespace nimproxy {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;
    std::string path;     // without query string
    std::map<std::string, std::string> headers;       // header names lowercased
    std::string body;

    // Return a header value (name in lowercase), or "" if absent.
    std::string header(const std::string& name) const;
};

// Writes the response for one request: either a complete body via send(),
// or an incremental stream via begin_stream() / write() / end().
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    // Complete response. Ignored once anything has been committed.
    virtual void send(int status, const std::string& content_type,
                      const std::string& body) = 0;

    // Commit status and headers of a streamed response.
    // Returns false if the client is gone.
    virtual bool begin_stream(int status, const std::vector<Header>& headers) = 0;

    // Append bytes to a started stream. Returns false if the client is gone.
    virtual bool write(const std::string& data) = 0;

    // Finish a started stream.
    virtual void end() = 0;

    // True once status and headers have gone out; a committed response can
    // no longer be turned into an error response.
    virtual bool committed() const = 0;
};

// Minimal threaded HTTP/1.1 server. Accepts on a background thread and serves
// each connection on its own thread, one request per connection.
// Adds permissive CORS headers and answers OPTIONS preflight itself.
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest&, ResponseWriter&)>;

    // listen_addr: "host:port", e.g. "0.0.0.0:3000"
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, size_t max_body, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, then wait for in-flight connections to finish.
    void stop();

    // Port actually bound (useful with port 0 in tests)
    uint16_t bound_port() const { return bound_port_; }

private:
    void accept_loop();
    void serve_connection(int client_fd);
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    size_t      max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    size_t active_connections_ = 0;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted only when
// allow_ephemeral is set.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral = false);

// Standard reason phrase for a status code ("OK" for unknown codes)
const char* status_reason(int status);

} // namespace nimproxy
