#include "auth/SignatureVerifier.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sg::config;
using sg::auth::SignatureVerifier;

namespace {
void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--expires <seconds>] <path>...\n"
              << "  --expires 0 mints a link that never expires (default 3600)\n";
}

int64_t parseSeconds(const std::string& s) {
    size_t used = 0;
    const auto v = std::stoll(s, &used);
    if (used != s.size() || v < 0) throw std::invalid_argument("--expires expects a non-negative number of seconds");
    return v;
}
}

int main(const int argc, char** argv) {
    std::filesystem::path configPath = defaultConfigPath();
    int64_t ttl = 3600;
    std::vector<std::string> paths;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
            else if (arg == "--expires" && i + 1 < argc) ttl = parseSeconds(argv[++i]);
            else if (arg == "-h" || arg == "--help") { usage(argv[0]); return EXIT_SUCCESS; }
            else if (arg.rfind("--", 0) == 0) { usage(argv[0]); return EXIT_FAILURE; }
            else paths.push_back(arg);
        }
    } catch (const std::exception& e) {
        std::cerr << "signgate-sign: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    if (paths.empty()) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        const auto cfg = loadConfig(configPath);
        cfg.validate();

        const SignatureVerifier signer(cfg.gateway.secret);
        int64_t expiry = 0;
        if (ttl > 0) {
            const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                SignatureVerifier::clock::now().time_since_epoch()).count();
            expiry = now + ttl;
        }

        for (const auto& p : paths) {
            const auto path = p.front() == '/' ? p : "/" + p;
            std::cout << cfg.gateway.public_address << path << "?sign=" << signer.sign(path, expiry) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "signgate-sign: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
