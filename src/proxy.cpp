#include "proxy.hpp"
#include "stream/stream_rewriter.hpp"

#include <iostream>
#include <utility>

namespace nimproxy {

std::vector<Header> event_stream_headers() {
    return {
        {"Content-Type", "text/event-stream"},
        {"Cache-Control", "no-cache"},
        {"Connection", "keep-alive"},
        {"X-Accel-Buffering", "no"}
    };
}

std::string upstream_error_detail(const HttpResponse& response) {
    if (!response.body.empty()) {
        try {
            return Json::parse(response.body).dump();
        } catch (const Json::parse_error&) {
            return response.body;
        }
    }
    if (!response.error.empty()) return response.error;
    return "Internal server error";
}

void send_json(ResponseWriter& writer, int status, const Json& body) {
    writer.send(status, "application/json",
                body.dump(-1, ' ', false, Json::error_handler_t::replace));
}

ProxyService::ProxyService(Config config, HttpClient& http)
    : config_(std::move(config)), http_(http) {
    for (const auto& m : config_.models)
        catalog_.set_mapping(m.first, m.second);
}

void ProxyService::handle(const HttpRequest& req, ResponseWriter& writer) const {
    if (req.method == "GET" && req.path == "/health") {
        handle_health(writer);
    } else if (req.method == "GET" && req.path == "/v1/models") {
        handle_models(writer);
    } else if (req.method == "POST" && req.path == "/v1/chat/completions") {
        handle_chat(req, writer);
    } else {
        send_json(writer, 404, error_body("Endpoint " + req.path + " not supported",
                                          "not_found", 404));
    }
}

void ProxyService::handle_health(ResponseWriter& writer) const {
    send_json(writer, 200, {
        {"status", "ok"},
        {"service", "OpenAI → NVIDIA NIM Proxy"},
        {"reasoning_display", config_.show_reasoning},
        {"thinking_mode", config_.thinking_mode},
        {"nim_base", config_.nim_api_base},
        {"api_key_set", config_.api_key_set()}
    });
}

void ProxyService::handle_models(ResponseWriter& writer) const {
    send_json(writer, 200, models_list(catalog_));
}

std::vector<Header> ProxyService::upstream_headers(bool stream) const {
    return {
        {"Authorization", "Bearer " + config_.nim_api_key},
        {"Content-Type", "application/json"},
        {"Accept", stream ? "text/event-stream" : "application/json"}
    };
}

std::string ProxyService::completions_url() const {
    return config_.nim_api_base + "/chat/completions";
}

void ProxyService::handle_chat(const HttpRequest& req, ResponseWriter& writer) const {
    if (!config_.api_key_set()) {
        send_json(writer, 500, error_body("NIM_API_KEY environment variable not set",
                                          "server_error"));
        return;
    }

    ChatRequest request;
    try {
        request = parse_chat_request(req.body);
    } catch (const RequestError& e) {
        send_json(writer, e.status(), error_body(e.what(), "invalid_request_error", e.status()));
        return;
    }

    std::string body = build_upstream_request(request, catalog_, config_.thinking_mode).dump();
    if (request.stream)
        forward_stream(request, body, writer);
    else
        forward_complete(request, body, writer);
}

void ProxyService::send_upstream_error(const HttpResponse& response,
                                       ResponseWriter& writer) const {
    int status = response.status_code != 0 ? static_cast<int>(response.status_code) : 500;
    std::string detail = upstream_error_detail(response);
    std::cerr << "[proxy] Proxy error [" << status << "]: " << detail << "\n";
    send_json(writer, status, error_body(detail, "proxy_error", status));
}

void ProxyService::forward_complete(const ChatRequest& request, const std::string& body,
                                    ResponseWriter& writer) const {
    HttpResponse response = http_.post(completions_url(), body, upstream_headers(false),
                                       config_.upstream_timeout);
    if (response.status_code < 200 || response.status_code >= 300) {
        send_upstream_error(response, writer);
        return;
    }

    Json result;
    try {
        result = translate_completion(Json::parse(response.body), request.model,
                                      config_.show_reasoning, ReasoningMarkers{});
    } catch (const std::exception& e) {
        std::cerr << "[proxy] Proxy error [500]: " << e.what() << "\n";
        send_json(writer, 500, error_body(e.what(), "proxy_error", 500));
        return;
    }
    send_json(writer, 200, result);
}

void ProxyService::forward_stream(const ChatRequest& request, const std::string& body,
                                  ResponseWriter& writer) const {
    RewriteOptions options;
    options.show_reasoning = config_.show_reasoning;
    options.model = request.model;
    StreamRewriter rewriter(std::move(options));

    bool client_gone = false;
    EmitCallback emit = [&](const std::string& bytes) {
        if (!writer.write(bytes)) {
            client_gone = true;
            return false;
        }
        return true;
    };

    HttpResponse response = http_.stream_post_raw(
        completions_url(), body, upstream_headers(true),
        [&](const char* data, size_t len) -> bool {
            // Upstream accepted: commit the event stream before the first byte
            if (!writer.committed() && !writer.begin_stream(200, event_stream_headers())) {
                client_gone = true;
                return false;
            }
            return rewriter.feed(data, len, emit);
        },
        config_.upstream_timeout);

    if (client_gone) {
        rewriter.abort();
        return;
    }

    bool ok_status = response.status_code >= 200 && response.status_code < 300;
    if (!writer.committed()) {
        if (!ok_status) {
            send_upstream_error(response, writer);
            return;
        }
        // Upstream accepted but sent no body
        if (!writer.begin_stream(200, event_stream_headers())) {
            rewriter.abort();
            return;
        }
    }

    if (!ok_status) {
        // Stream already started; it can only be ended, not turned into an error
        std::cerr << "[proxy] Stream error: " << upstream_error_detail(response) << "\n";
        rewriter.abort();
    } else {
        rewriter.finish(emit);
    }
    writer.end();
}

} // namespace nimproxy
