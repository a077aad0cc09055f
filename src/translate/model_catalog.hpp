#pragma once
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>

namespace nimproxy {

// How a provider model is asked to reason.
struct ModelCapabilities {
    bool native_reasoning = false;        // always reasons, nothing to add
    bool template_thinking = false;       // chat_template_kwargs.enable_thinking
    bool system_prompt_thinking = false;  // magic system prompt prefix
};

constexpr const char* kThinkingSystemPrompt = "detailed thinking on";

// Client model ids → provider model ids, and provider model ids → capabilities.
class ModelCatalog {
public:
    // Built-in mapping and capability tables
    ModelCatalog();

    // Add a mapping or replace an existing one (keeps its listing position).
    void set_mapping(const std::string& client_model, const std::string& provider_model);

    // Provider id for a client id; unknown ids pass through verbatim.
    std::string resolve(const std::string& client_model) const;

    // Capabilities of a provider model (all false when unknown).
    ModelCapabilities capabilities(const std::string& provider_model) const;

    // Client-facing ids in listing order
    std::vector<std::string> client_models() const;

private:
    std::vector<std::pair<std::string, std::string>> mappings_;
    std::unordered_map<std::string, ModelCapabilities> capabilities_;
};

} // namespace nimproxy
