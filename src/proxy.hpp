#pragma once
#include "config.hpp"
#include "http.hpp"
#include "server.hpp"
#include "translate/model_catalog.hpp"
#include "translate/chat_translator.hpp"
#include <string>
#include <vector>

namespace nimproxy {

// OpenAI-compatible front for the NIM API. Stateless between requests, so
// one instance serves all connections concurrently.
class ProxyService {
public:
    ProxyService(Config config, HttpClient& http);

    // Route one request: /health, /v1/models, /v1/chat/completions, else 404.
    void handle(const HttpRequest& req, ResponseWriter& writer) const;

    const ModelCatalog& catalog() const { return catalog_; }

private:
    void handle_health(ResponseWriter& writer) const;
    void handle_models(ResponseWriter& writer) const;
    void handle_chat(const HttpRequest& req, ResponseWriter& writer) const;

    void forward_stream(const ChatRequest& request, const std::string& body,
                        ResponseWriter& writer) const;
    void forward_complete(const ChatRequest& request, const std::string& body,
                          ResponseWriter& writer) const;

    // Relay a failed upstream exchange as a JSON error (before any byte was sent)
    void send_upstream_error(const HttpResponse& response, ResponseWriter& writer) const;

    std::vector<Header> upstream_headers(bool stream) const;
    std::string completions_url() const;

    Config config_;
    HttpClient& http_;
    ModelCatalog catalog_;
};

// Headers that keep intermediaries from buffering an event stream
std::vector<Header> event_stream_headers();

// Human-readable detail of a failed upstream exchange: the body (compacted
// when it is JSON), else the transport error.
std::string upstream_error_detail(const HttpResponse& response);

void send_json(ResponseWriter& writer, int status, const Json& body);

} // namespace nimproxy
