#include <iostream>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <atomic>

#include "core/app_context.hpp"
#include "network/api_router.hpp"
#include "network/api_server.hpp"
#include "utils/logger.hpp"
#include "utils/config_manager.hpp"

using namespace dlnacast;

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file>]\n"
              << "  --config <file>   JSON configuration (default: config/dlnacast.json,\n"
              << "                    or $DLNACAST_CONFIG)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config/dlnacast.json";
    if (const char* env = std::getenv("DLNACAST_CONFIG")) {
        if (*env != '\0') {
            configPath = env;
        }
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // Renderers hang up on the relay mid-write
    std::signal(SIGPIPE, SIG_IGN);

    try {
        Logger::initialize();

        ConfigManager configManager;
        if (!configManager.initialize(configPath)) {
            Logger::error("Failed to load configuration");
            return 1;
        }
        const Configuration config = configManager.getConfiguration();

        Logger::Level level = Logger::Level::Info;
        if (Logger::parseLevel(config.log.level, level)) {
            Logger::setLevel(level);
        } else {
            Logger::warning("Unknown log level '{}', using INFO", config.log.level);
        }
        if (!config.log.file.empty()) {
            Logger::shutdown();
            Logger::initialize(config.log.file, level, true);
        }

        const network::BuildInfo buildInfo = network::ApiRouter::defaultBuildInfo();
        Logger::info("{} {} starting (build {}, {})", buildInfo.name, buildInfo.version,
                     buildInfo.buildHash, buildInfo.buildDate);
        Logger::info("Data directory: {}", config.storage.dataDir);
        Logger::info("API authentication: {}", config.security.apiAuthEnabled ? "Enabled" : "Disabled");
        Logger::info("Rate limiting: {}", config.security.rateLimitEnabled ? config.security.rateLimitDefault : "Disabled");

        core::AppContext context(config);
        context.start();

        network::ApiRouter router(config, context.orchestrator(), context.formatCache(), buildInfo);
        network::ApiServer server(router, config.server.host, config.server.port, config.server.workerThreads);
        if (!server.start()) {
            Logger::error("Failed to start API server");
            context.shutdown();
            return 1;
        }

        Logger::info("Press Ctrl+C to stop");
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        Logger::info("Shutting down gracefully...");
        server.stop();
        context.shutdown();

        Logger::info("{} stopped", buildInfo.name);
        Logger::shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
