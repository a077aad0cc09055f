#include "config.hpp"
#include "http.hpp"
#include "proxy.hpp"
#include "server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: nimproxy [options]\n"
              << "\n"
              << "Options:\n"
              << "  --port N             Listen port (default 3000)\n"
              << "  --host ADDR          Bind address (default 0.0.0.0)\n"
              << "  --no-reasoning       Drop reasoning instead of showing it in <think> blocks\n"
              << "  --no-thinking        Do not ask models to reason\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  NIM_API_KEY            API key for NVIDIA NIM (required)\n"
              << "  NIM_API_BASE           NIM base URL (default: https://integrate.api.nvidia.com/v1)\n"
              << "  PORT                   Listen port\n"
              << "  LISTEN_HOST            Bind address\n"
              << "  SHOW_REASONING         'false' hides reasoning\n"
              << "  ENABLE_THINKING_MODE   'false' disables thinking mode\n";
}

int main(int argc, char* argv[]) try {
    std::string port_arg;
    std::string host_arg;
    bool no_reasoning = false;
    bool no_thinking = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--no-reasoning") == 0) {
            no_reasoning = true;
        } else if (std::strcmp(argv[i], "--no-thinking") == 0) {
            no_thinking = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    nimproxy::http_init();
    auto config = nimproxy::Config::load();

    // Override config with CLI args
    if (!port_arg.empty()) {
        char* end = nullptr;
        unsigned long port = std::strtoul(port_arg.c_str(), &end, 10);
        if (end == port_arg.c_str() || *end != '\0' || port == 0 || port > 65535) {
            std::cerr << "Error: invalid port: " << port_arg << "\n";
            nimproxy::http_cleanup();
            return 1;
        }
        config.port = static_cast<uint16_t>(port);
    }
    if (!host_arg.empty()) config.listen_host = host_arg;
    if (no_reasoning) config.show_reasoning = false;
    if (no_thinking) config.thinking_mode = false;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    nimproxy::http_set_abort_flag(&g_shutdown);

    nimproxy::PlatformHttpClient http_client;
    nimproxy::ProxyService proxy(config, http_client);
    nimproxy::HttpServer server(
        config.listen_addr(), config.max_body,
        [&proxy](const nimproxy::HttpRequest& req, nimproxy::ResponseWriter& writer) {
            proxy.handle(req, writer);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        nimproxy::http_cleanup();
        return 1;
    }

    std::cerr << "[server] OpenAI → NVIDIA NIM Proxy listening on " << config.listen_addr() << "\n"
              << "[server] Health:        http://localhost:" << server.bound_port() << "/health\n"
              << "[server] Reasoning:     " << (config.show_reasoning ? "enabled" : "disabled")
              << " (set SHOW_REASONING=false to disable)\n"
              << "[server] Thinking mode: " << (config.thinking_mode ? "enabled" : "disabled")
              << " (set ENABLE_THINKING_MODE=false to disable)\n"
              << "[server] NIM API key:   "
              << (config.api_key_set() ? "set" : "NOT SET (set NIM_API_KEY)") << "\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    nimproxy::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
