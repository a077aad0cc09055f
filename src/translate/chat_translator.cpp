#include "chat_translator.hpp"
#include "../util.hpp"

namespace nimproxy {

ChatRequest parse_chat_request(const std::string& body) {
    Json j;
    try {
        j = Json::parse(body);
    } catch (const Json::parse_error& e) {
        throw RequestError(400, std::string("Invalid JSON body: ") + e.what());
    }
    if (!j.is_object())
        throw RequestError(400, "Request body must be a JSON object");

    ChatRequest req;
    auto model = j.find("model");
    if (model == j.end() || !model->is_string() || model->get_ref<const std::string&>().empty())
        throw RequestError(400, "'model' is required");
    req.model = model->get<std::string>();

    auto messages = j.find("messages");
    if (messages == j.end() || !messages->is_array())
        throw RequestError(400, "'messages' must be an array");
    req.messages = *messages;

    auto temperature = j.find("temperature");
    if (temperature != j.end() && temperature->is_number())
        req.temperature = temperature->get<double>();

    auto max_tokens = j.find("max_tokens");
    if (max_tokens != j.end() && max_tokens->is_number_integer())
        req.max_tokens = max_tokens->get<int64_t>();

    auto stream = j.find("stream");
    if (stream != j.end() && stream->is_boolean())
        req.stream = stream->get<bool>();

    return req;
}

// Prefix the leading system message, or insert one.
static Json with_thinking_prompt(const Json& messages) {
    Json out = messages;
    if (!out.empty() && out[0].is_object() && out[0].value("role", "") == "system") {
        auto& content = out[0]["content"];
        if (content.is_string()) {
            content = std::string(kThinkingSystemPrompt) + "\n\n" +
                      content.get<std::string>();
            return out;
        }
    }
    Json system = {{"role", "system"}, {"content", kThinkingSystemPrompt}};
    out.insert(out.begin(), system);
    return out;
}

Json build_upstream_request(const ChatRequest& request, const ModelCatalog& catalog,
                            bool thinking_mode) {
    std::string provider_model = catalog.resolve(request.model);
    ModelCapabilities caps = catalog.capabilities(provider_model);

    Json body;
    body["model"] = provider_model;
    body["messages"] = (thinking_mode && caps.system_prompt_thinking)
        ? with_thinking_prompt(request.messages)
        : request.messages;
    body["temperature"] = request.temperature.value_or(kDefaultTemperature);
    body["max_tokens"] = (request.max_tokens && *request.max_tokens != 0)
        ? *request.max_tokens
        : kDefaultMaxTokens;
    body["stream"] = request.stream;

    if (thinking_mode && caps.template_thinking)
        body["chat_template_kwargs"] = {{"enable_thinking", true}};

    return body;
}

Json translate_completion(const Json& upstream, const std::string& client_model,
                          bool show_reasoning, const ReasoningMarkers& markers) {
    if (!upstream.is_object() || !upstream.contains("choices") ||
        !upstream["choices"].is_array()) {
        throw std::runtime_error("Upstream response has no choices");
    }

    Json choices = Json::array();
    for (const auto& choice : upstream["choices"]) {
        Json msg = (choice.is_object() && choice.contains("message") &&
                    choice["message"].is_object())
            ? choice["message"]
            : Json::object();

        std::string content;
        if (msg.contains("content") && msg["content"].is_string())
            content = msg["content"].get<std::string>();
        if (show_reasoning)
            content = join_reasoning(reasoning_text(msg), content, markers);

        std::string role = "assistant";
        if (msg.contains("role") && msg["role"].is_string())
            role = msg["role"].get<std::string>();

        Json out;
        if (choice.is_object() && choice.contains("index"))
            out["index"] = choice["index"];
        out["message"] = {{"role", role}, {"content", content}};
        if (choice.is_object() && choice.contains("finish_reason"))
            out["finish_reason"] = choice["finish_reason"];
        choices.push_back(out);
    }

    Json usage = {{"prompt_tokens", 0}, {"completion_tokens", 0}, {"total_tokens", 0}};
    if (upstream.contains("usage") && !upstream["usage"].is_null())
        usage = upstream["usage"];

    Json result;
    result["id"] = "chatcmpl-" + std::to_string(epoch_millis());
    result["object"] = "chat.completion";
    result["created"] = epoch_seconds();
    result["model"] = client_model;
    result["choices"] = choices;
    result["usage"] = usage;
    return result;
}

Json error_body(const std::string& message, const std::string& type,
                std::optional<int> code) {
    Json err = {{"message", message}, {"type", type}};
    if (code) err["code"] = *code;
    return {{"error", err}};
}

Json models_list(const ModelCatalog& catalog) {
    Json data = Json::array();
    for (const auto& id : catalog.client_models()) {
        data.push_back({
            {"id", id},
            {"object", "model"},
            {"created", 1700000000},
            {"owned_by", "nvidia-nim-proxy"}
        });
    }
    return {{"object", "list"}, {"data", data}};
}

} // namespace nimproxy
