#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace sg::config {

constexpr static unsigned int DEFAULT_MAX_REDIRECTS = 10;

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8787;
    unsigned int worker_threads = 0; // 0 = hardware_concurrency
};

struct GatewayConfig {
    std::string public_address;     // e.g. https://dl.example.com, used to detect self-redirects
    std::string secret;             // HMAC key shared with the backend
    unsigned int max_redirects = DEFAULT_MAX_REDIRECTS;
};

struct BackendConfig {
    std::string address;            // e.g. https://alist.example.com
    std::string token;              // sent as Authorization, defaults to gateway.secret
    std::string verify_header;
    std::string verify_secret;
    long timeout_seconds = 15;
};

struct FetchConfig {
    long connect_timeout_seconds = 10;
    long low_speed_seconds = 60;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum gateway = spdlog::level::info;   // Startup, shutdown, self-redirect re-entry
    spdlog::level::level_enum http    = spdlog::level::warn;   // Socket errors, malformed requests
    spdlog::level::level_enum auth    = spdlog::level::warn;   // Rejected signatures
    spdlog::level::level_enum backend = spdlog::level::warn;   // Backend unreachable or declared errors
    spdlog::level::level_enum fetch   = spdlog::level::warn;   // Upstream failures, redirect loops
};

struct LoggingConfig {
    spdlog::level::level_enum console_level = spdlog::level::info;
    spdlog::level::level_enum file_level = spdlog::level::warn;
    std::filesystem::path file;     // empty = console only
    SubsystemLogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    GatewayConfig gateway;
    BackendConfig backend;
    FetchConfig fetch;
    LoggingConfig logging;

    // Throws std::runtime_error naming the first missing required key.
    void validate() const;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

// Effective configuration as YAML, secrets masked unless redactSecrets is false
std::string dumpConfig(const Config& cfg, bool redactSecrets = true);

std::filesystem::path defaultConfigPath();

}
