#include "model_catalog.hpp"

namespace nimproxy {

ModelCatalog::ModelCatalog()
    : mappings_{
          {"gpt-3.5-turbo",   "nvidia/llama-3.1-nemotron-ultra-253b-v1"},
          {"gpt-4",           "qwen/qwen3-235b-a22b"},
          {"gpt-4-turbo",     "deepseek-ai/deepseek-r1-0528"},
          {"gpt-4o",          "deepseek-ai/deepseek-v3"},
          {"gpt-4o-mini",     "meta/llama-3.3-70b-instruct"},
          {"claude-3-opus",   "nvidia/llama-3.1-nemotron-ultra-253b-v1"},
          {"claude-3-sonnet", "qwen/qwen3-235b-a22b"},
          {"claude-3-haiku",  "deepseek-ai/deepseek-r1-distill-qwen-32b"},
          {"gemini-pro",      "deepseek-ai/deepseek-r1-0528"},
      } {
    ModelCapabilities native;
    native.native_reasoning = true;
    ModelCapabilities templ;
    templ.template_thinking = true;
    ModelCapabilities prompt;
    prompt.system_prompt_thinking = true;

    capabilities_ = {
        {"deepseek-ai/deepseek-r1-0528",              native},
        {"deepseek-ai/deepseek-r1-distill-qwen-32b",  native},
        {"deepseek-ai/deepseek-r1-distill-qwen-14b",  native},
        {"deepseek-ai/deepseek-r1-distill-llama-8b",  native},
        {"qwen/qwen3-235b-a22b",                      templ},
        {"qwen/qwen3-coder-480b-a35b-instruct",       templ},
        {"nvidia/llama-3.1-nemotron-ultra-253b-v1",   prompt},
    };
}

void ModelCatalog::set_mapping(const std::string& client_model,
                               const std::string& provider_model) {
    for (auto& m : mappings_) {
        if (m.first == client_model) {
            m.second = provider_model;
            return;
        }
    }
    mappings_.emplace_back(client_model, provider_model);
}

std::string ModelCatalog::resolve(const std::string& client_model) const {
    for (const auto& m : mappings_) {
        if (m.first == client_model) return m.second;
    }
    return client_model;
}

ModelCapabilities ModelCatalog::capabilities(const std::string& provider_model) const {
    auto it = capabilities_.find(provider_model);
    return it != capabilities_.end() ? it->second : ModelCapabilities{};
}

std::vector<std::string> ModelCatalog::client_models() const {
    std::vector<std::string> ids;
    ids.reserve(mappings_.size());
    for (const auto& m : mappings_) ids.push_back(m.first);
    return ids;
}

} // namespace nimproxy
