#include "app.h"
#include "config.h"
#include "log.h"
#include "navigator.h"
#include "core/memory_hub.h"
#include <iostream>
#include <csignal>
#include <cstring>
#include <string>

namespace {
    drive::App* g_app = nullptr;
}

void signalHandler(int signal) {
    if (g_app) {
        g_app->requestQuit();
    }
}

void printUsage() {
    std::cout << "drive-tui v0.3.0 - Terminal client for remote drive storage\n\n";
    std::cout << "Usage: drive-tui [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --demo           Browse an in-memory sample drive\n";
    std::cout << "  --config <path>  Config file (default ~/.drive-tui/drive-tui.ini)\n";
    std::cout << "  --log <path>     Append log messages to <path>\n";
    std::cout << "  -v, --version    Show version\n";
    std::cout << "  -h, --help       Show this help\n";
}

int main(int argc, char* argv[]) {
    bool demoMode = false;
    std::string configPath = drive::Config::defaultPath().string();
    std::string logPath;

    // Check for command line arguments
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--demo") == 0) {
            demoMode = true;
        } else if (std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "--log") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << argv[i] << "\n";
                return 1;
            }
            if (std::strcmp(argv[i], "--config") == 0) {
                configPath = argv[++i];
            } else {
                logPath = argv[++i];
            }
        } else if (std::strcmp(argv[i], "--version") == 0 || std::strcmp(argv[i], "-v") == 0) {
            std::cout << "drive-tui v0.3.0\n";
            return 0;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n\n";
            printUsage();
            return 1;
        }
    }

    drive::Config config = drive::Config::load(configPath);
    if (!logPath.empty()) {
        config.logFile = logPath;
    }

    try {
        drive::initLogging(config.logFile, config.logLevel);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot open log file: " << e.what() << std::endl;
        return 1;
    }
    for (const auto& warning : config.warnings) {
        drive::logger()->warn("[UI] Config {}: {}", configPath, warning);
    }

    if (!demoMode) {
        std::cerr << "No storage backend is configured in this build.\n";
        std::cerr << "Run with --demo to browse an in-memory sample drive.\n";
        return 1;
    }

    // Set up signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        drive::MemoryHub hub;
        hub.seedDemo();

        drive::Navigator navigator(hub, config);
        navigator.reload();

        drive::App app(navigator, config);
        g_app = &app;
        app.run();
        g_app = nullptr;

        return 0;

    } catch (const std::exception& e) {
        g_app = nullptr;
        drive::logger()->error("[UI] Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
