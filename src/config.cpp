#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>

namespace nimproxy {

nlohmann::json Config::defaults_json() {
    return {
        {"listen_host", "0.0.0.0"},
        {"port", 3000},
        {"nim_api_base", "https://integrate.api.nvidia.com/v1"},
        {"nim_api_key", ""},
        {"show_reasoning", true},
        {"thinking_mode", true},
        {"max_body", 10 * 1024 * 1024},
        {"upstream_timeout", 120},
        {"models", nlohmann::json::object()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::optional<uint64_t> non_negative(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return std::nullopt;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    int64_t v = it->get<int64_t>();
    if (v < 0) return std::nullopt;
    return static_cast<uint64_t>(v);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("listen_host") && j["listen_host"].is_string())
        cfg.listen_host = j["listen_host"].get<std::string>();
    if (auto port = non_negative(j, "port");
        port && *port > 0 && *port <= std::numeric_limits<uint16_t>::max())
        cfg.port = static_cast<uint16_t>(*port);
    if (j.contains("nim_api_base") && j["nim_api_base"].is_string())
        cfg.nim_api_base = j["nim_api_base"].get<std::string>();
    if (j.contains("nim_api_key") && j["nim_api_key"].is_string())
        cfg.nim_api_key = j["nim_api_key"].get<std::string>();
    if (j.contains("show_reasoning") && j["show_reasoning"].is_boolean())
        cfg.show_reasoning = j["show_reasoning"].get<bool>();
    if (j.contains("thinking_mode") && j["thinking_mode"].is_boolean())
        cfg.thinking_mode = j["thinking_mode"].get<bool>();
    if (auto max_body = non_negative(j, "max_body");
        max_body && *max_body <= std::numeric_limits<uint32_t>::max())
        cfg.max_body = static_cast<uint32_t>(*max_body);
    if (auto timeout = non_negative(j, "upstream_timeout");
        timeout && *timeout > 0 && *timeout <= std::numeric_limits<uint32_t>::max())
        cfg.upstream_timeout = static_cast<uint32_t>(*timeout);

    if (j.contains("models") && j["models"].is_object()) {
        for (auto& [client_model, provider_model] : j["models"].items()) {
            if (provider_model.is_string() && !provider_model.get<std::string>().empty())
                cfg.models.emplace_back(client_model, provider_model.get<std::string>());
        }
    }
    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.nimproxy/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

bool env_flag_enabled(const char* value) {
    return std::string(value) != "false";
}

void Config::apply_env() {
    if (const char* v = std::getenv("PORT")) {
        char* end = nullptr;
        unsigned long p = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0' && p > 0 && p <= 65535)
            port = static_cast<uint16_t>(p);
        else
            std::cerr << "[config] Ignoring invalid PORT: " << v << "\n";
    }
    if (const char* v = std::getenv("LISTEN_HOST"))
        listen_host = v;
    if (const char* v = std::getenv("NIM_API_BASE"))
        nim_api_base = v;
    if (const char* v = std::getenv("NIM_API_KEY"))
        nim_api_key = v;
    if (const char* v = std::getenv("SHOW_REASONING"))
        show_reasoning = env_flag_enabled(v);
    if (const char* v = std::getenv("ENABLE_THINKING_MODE"))
        thinking_mode = env_flag_enabled(v);
}

std::string Config::listen_addr() const {
    return listen_host + ":" + std::to_string(port);
}

} // namespace nimproxy
