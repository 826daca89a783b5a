#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "services/GatewayService.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace sg::config;
using namespace sg::logging;
using namespace sg::services;

namespace {
std::atomic shouldExit = false;

void signalHandler(int) {
    shouldExit = true;
}

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--print-config]\n";
}
}

int main(const int argc, char** argv) {
    std::filesystem::path configPath = defaultConfigPath();
    bool printConfig = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
        else if (arg.rfind("--config=", 0) == 0) configPath = arg.substr(9);
        else if (arg == "--print-config") printConfig = true;
        else if (arg == "-h" || arg == "--help") { usage(argv[0]); return EXIT_SUCCESS; }
        else { usage(argv[0]); return EXIT_FAILURE; }
    }

    try {
        ConfigRegistry::init(configPath);
    } catch (const std::exception& e) {
        std::cerr << "signgate: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    if (printConfig) {
        std::cout << dumpConfig(ConfigRegistry::get()) << std::endl;
        return EXIT_SUCCESS;
    }

    try {
        LogRegistry::init(ConfigRegistry::get().logging);
        LogRegistry::gateway()->info("[*] Starting signgate with config {}", configPath.string());

        GatewayService service(ConfigRegistry::get());
        service.start();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(250));

        LogRegistry::gateway()->info("[!] Shutdown signal received. Shutting down gracefully...");
        service.stop();
        LogRegistry::gateway()->info("[✓] signgate stopped.");
        spdlog::shutdown();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::gateway()->critical("[!] Fatal: {}", e.what());
        else std::cerr << "signgate: " << e.what() << "\n";
        spdlog::shutdown();
        return EXIT_FAILURE;
    }
}
