#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace sg::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // optional rotating file sink
    if (!cnf.file.empty()) {
        namespace fs = std::filesystem;
        if (const auto dir = cnf.file.parent_path(); !dir.empty() && !fs::exists(dir))
            fs::create_directories(dir);

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cnf.file.string(), max_bytes_, max_files_);
        file_sink_->set_level(cnf.file_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels;
    makeLogger("gateway", sub_levels.gateway);
    makeLogger("http",    sub_levels.http);
    makeLogger("auth",    sub_levels.auth);
    makeLogger("backend", sub_levels.backend);
    makeLogger("fetch",   sub_levels.fetch);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
