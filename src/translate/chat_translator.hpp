#pragma once
#include "model_catalog.hpp"
#include "../stream/frame_splicer.hpp"
#include <string>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace nimproxy {

using Json = nlohmann::ordered_json;

// Client request rejected before any upstream call; carries the HTTP status.
class RequestError : public std::runtime_error {
public:
    RequestError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}
    int status() const { return status_; }

private:
    int status_;
};

// Fields of an inbound chat-completion request the proxy reads.
struct ChatRequest {
    std::string model;
    Json messages = Json::array();
    std::optional<double> temperature;
    std::optional<int64_t> max_tokens;
    bool stream = false;
};

constexpr double kDefaultTemperature = 0.6;
constexpr int64_t kDefaultMaxTokens = 16384;

// Parse and presence-check a request body. Throws RequestError (400).
ChatRequest parse_chat_request(const std::string& body);

// Upstream request body: mapped model, parameter defaults and, when
// thinking_mode is on, the provider model's thinking switch.
Json build_upstream_request(const ChatRequest& request, const ModelCatalog& catalog,
                            bool thinking_mode);

// Client-facing chat.completion built from a complete upstream response.
// Throws std::runtime_error if the upstream response has no choices array.
Json translate_completion(const Json& upstream, const std::string& client_model,
                          bool show_reasoning, const ReasoningMarkers& markers);

// {"error":{"message":..,"type":..[,"code":..]}}
Json error_body(const std::string& message, const std::string& type,
                std::optional<int> code = std::nullopt);

// OpenAI-style model listing of the client-facing ids
Json models_list(const ModelCatalog& catalog);

} // namespace nimproxy
