#ifndef DRIVE_TUI_CONFIG_H
#define DRIVE_TUI_CONFIG_H

#include "core/hub.h"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace drive {

struct Config {
    size_t chunkSize = 8 * 1024 * 1024;
    int maxRetries = 100000;
    int minBackoffSecs = 1;
    int maxBackoffSecs = 60;
    size_t maxFiles = 1000;
    int pollIntervalMs = 250;
    int blinkIntervalMs = 500;
    std::string theme = "Default";
    std::string logFile;
    std::string logLevel = "info";

    // Problems found while loading; the affected keys keep their defaults
    std::vector<std::string> warnings;

    // Reads `key = value` lines from `path`. A missing file yields the
    // defaults; an unreadable one adds a warning.
    static Config load(const std::filesystem::path& path);

    // Parses the contents of a config file
    static Config parse(const std::string& text);

    // ~/.drive-tui/drive-tui.ini
    static std::filesystem::path defaultPath();

    UploadConfig uploadConfig() const;
    std::chrono::milliseconds pollInterval() const { return std::chrono::milliseconds(pollIntervalMs); }
    std::chrono::milliseconds blinkInterval() const { return std::chrono::milliseconds(blinkIntervalMs); }
};

}  // namespace drive

#endif  // DRIVE_TUI_CONFIG_H
