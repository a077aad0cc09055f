#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

namespace nimproxy {

struct Config {
    std::string listen_host = "0.0.0.0";
    uint16_t port = 3000;
    std::string nim_api_base = "https://integrate.api.nvidia.com/v1";
    std::string nim_api_key;
    bool show_reasoning = true;   // inject reasoning into content between markers
    bool thinking_mode = true;    // ask capable models to reason
    uint32_t max_body = 10 * 1024 * 1024;
    uint32_t upstream_timeout = 120; // seconds

    // Extra client → provider model mappings, applied over the built-in table
    std::vector<std::pair<std::string, std::string>> models;

    // Load from ~/.nimproxy/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config JSON object; keys with the wrong type keep their defaults
    static Config from_json(const nlohmann::json& j);

    // Environment variables override the file
    void apply_env();

    // "host:port" for the HTTP server
    std::string listen_addr() const;

    bool api_key_set() const { return !nim_api_key.empty(); }
};

// Flag semantics for SHOW_REASONING / ENABLE_THINKING_MODE: on unless "false"
bool env_flag_enabled(const char* value);

} // namespace nimproxy
