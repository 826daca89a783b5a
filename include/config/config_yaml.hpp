#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sg::config;

static std::string stripTrailingSlash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str maps unknown names to "off", only honour it when asked for explicitly
    if (lvl == spdlog::level::off && node.as<std::string>() != "off") return def;
    return lvl;
}

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["worker_threads"] = rhs.worker_threads;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(8787);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(0);
        return true;
    }
};

template<>
struct convert<GatewayConfig> {
    static Node encode(const GatewayConfig& rhs) {
        Node node;
        node["public_address"] = rhs.public_address;
        node["secret"] = rhs.secret;
        node["max_redirects"] = rhs.max_redirects;
        return node;
    }

    static bool decode(const Node& node, GatewayConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.public_address = stripTrailingSlash(node["public_address"].as<std::string>(""));
        rhs.secret = node["secret"].as<std::string>("");
        rhs.max_redirects = node["max_redirects"].as<unsigned int>(DEFAULT_MAX_REDIRECTS);
        return true;
    }
};

template<>
struct convert<BackendConfig> {
    static Node encode(const BackendConfig& rhs) {
        Node node;
        node["address"] = rhs.address;
        node["token"] = rhs.token;
        node["verify_header"] = rhs.verify_header;
        node["verify_secret"] = rhs.verify_secret;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, BackendConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.address = stripTrailingSlash(node["address"].as<std::string>(""));
        rhs.token = node["token"].as<std::string>("");
        rhs.verify_header = node["verify_header"].as<std::string>("");
        rhs.verify_secret = node["verify_secret"].as<std::string>("");
        rhs.timeout_seconds = node["timeout_seconds"].as<long>(15);
        return true;
    }
};

template<>
struct convert<FetchConfig> {
    static Node encode(const FetchConfig& rhs) {
        Node node;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["low_speed_seconds"] = rhs.low_speed_seconds;
        return node;
    }

    static bool decode(const Node& node, FetchConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<long>(10);
        rhs.low_speed_seconds = node["low_speed_seconds"].as<long>(60);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["gateway"] = to_std_string(spdlog::level::to_string_view(rhs.gateway));
        node["http"]    = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["auth"]    = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["backend"] = to_std_string(spdlog::level::to_string_view(rhs.backend));
        node["fetch"]   = to_std_string(spdlog::level::to_string_view(rhs.fetch));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig defaults;
        rhs.gateway = levelOr(node["gateway"], defaults.gateway);
        rhs.http    = levelOr(node["http"], defaults.http);
        rhs.auth    = levelOr(node["auth"], defaults.auth);
        rhs.backend = levelOr(node["backend"], defaults.backend);
        rhs.fetch   = levelOr(node["fetch"], defaults.fetch);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_level));
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_level));
        node["file"] = rhs.file.string();
        node["levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        const LoggingConfig defaults;
        rhs.console_level = levelOr(node["console_level"], defaults.console_level);
        rhs.file_level = levelOr(node["file_level"], defaults.file_level);
        rhs.file = node["file"].as<std::string>("");
        if (const auto levels = node["levels"]) convert<SubsystemLogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
