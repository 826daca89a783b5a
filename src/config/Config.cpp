#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sg::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["gateway"]) YAML::convert<GatewayConfig>::decode(node, cfg.gateway);
    if (auto node = root["backend"]) YAML::convert<BackendConfig>::decode(node, cfg.backend);
    if (auto node = root["fetch"]) YAML::convert<FetchConfig>::decode(node, cfg.fetch);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    // AList authorizes /api/fs/link with the same token it signs with
    if (cfg.backend.token.empty()) cfg.backend.token = cfg.gateway.secret;

    return cfg;
}

}

void Config::validate() const {
    if (gateway.secret.empty()) throw std::runtime_error("Config: gateway.secret is required");
    if (gateway.public_address.empty()) throw std::runtime_error("Config: gateway.public_address is required");
    if (backend.address.empty()) throw std::runtime_error("Config: backend.address is required");
    if (!backend.verify_header.empty() && backend.verify_secret.empty())
        throw std::runtime_error("Config: backend.verify_secret is required when backend.verify_header is set");
}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

std::string dumpConfig(const Config& cfg, const bool redactSecrets) {
    constexpr auto mask = "********";

    YAML::Node root;
    root["server"] = YAML::convert<ServerConfig>::encode(cfg.server);
    root["gateway"] = YAML::convert<GatewayConfig>::encode(cfg.gateway);
    root["backend"] = YAML::convert<BackendConfig>::encode(cfg.backend);
    root["fetch"] = YAML::convert<FetchConfig>::encode(cfg.fetch);
    root["logging"] = YAML::convert<LoggingConfig>::encode(cfg.logging);

    if (redactSecrets) {
        if (!cfg.gateway.secret.empty()) root["gateway"]["secret"] = mask;
        if (!cfg.backend.token.empty()) root["backend"]["token"] = mask;
        if (!cfg.backend.verify_secret.empty()) root["backend"]["verify_secret"] = mask;
    }

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

std::filesystem::path defaultConfigPath() {
    if (const char* env = std::getenv("SIGNGATE_CONFIG"); env && *env) return env;
    return "/etc/signgate/config.yaml";
}

}
