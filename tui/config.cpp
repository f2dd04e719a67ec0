#include "config.h"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace drive {

namespace fs = std::filesystem;

namespace {

constexpr size_t kChunkAlignment = 256 * 1024;

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseNumber(const std::string& value, long long& out) {
    if (value.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') return false;
    out = n;
    return true;
}

bool isLogLevel(const std::string& level) {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* l : levels) {
        if (level == l) return true;
    }
    return false;
}

}  // namespace

Config Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Config{};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        Config config;
        config.warnings.push_back("Cannot read config file '" + path.string() + "'");
        return config;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    return parse(contents.str());
}

Config Config::parse(const std::string& text) {
    Config config;
    std::istringstream lines(text);
    std::string line;
    int lineNo = 0;

    while (std::getline(lines, line)) {
        lineNo++;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            config.warnings.push_back("Line " + std::to_string(lineNo) + ": expected key = value");
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        auto invalid = [&](const std::string& why) {
            config.warnings.push_back("Invalid " + key + " '" + value + "': " + why);
        };

        long long n = 0;
        if (key == "theme") {
            config.theme = value;
        } else if (key == "log_file") {
            config.logFile = value;
        } else if (key == "log_level") {
            if (isLogLevel(value)) {
                config.logLevel = value;
            } else {
                invalid("unknown level");
            }
        } else if (key == "chunk_size" || key == "max_retries" || key == "min_backoff_secs" ||
                   key == "max_backoff_secs" || key == "max_files" ||
                   key == "poll_interval_ms" || key == "blink_interval_ms") {
            if (!parseNumber(value, n)) {
                invalid("not a number");
                continue;
            }
            if (key == "chunk_size") {
                if (n <= 0 || n % (long long)kChunkAlignment != 0) {
                    invalid("must be a positive multiple of 262144");
                } else {
                    config.chunkSize = (size_t)n;
                }
            } else if (key == "max_retries") {
                if (n < 0) invalid("must not be negative");
                else config.maxRetries = (int)n;
            } else if (key == "min_backoff_secs") {
                if (n < 0) invalid("must not be negative");
                else config.minBackoffSecs = (int)n;
            } else if (key == "max_backoff_secs") {
                if (n < 0) invalid("must not be negative");
                else config.maxBackoffSecs = (int)n;
            } else if (key == "max_files") {
                if (n <= 0) invalid("must be positive");
                else config.maxFiles = (size_t)n;
            } else if (key == "poll_interval_ms") {
                if (n <= 0) invalid("must be positive");
                else config.pollIntervalMs = (int)n;
            } else {
                if (n <= 0) invalid("must be positive");
                else config.blinkIntervalMs = (int)n;
            }
        } else {
            config.warnings.push_back("Unknown key '" + key + "'");
        }
    }

    if (config.maxBackoffSecs < config.minBackoffSecs) {
        config.warnings.push_back("max_backoff_secs is below min_backoff_secs, using defaults");
        config.minBackoffSecs = Config{}.minBackoffSecs;
        config.maxBackoffSecs = Config{}.maxBackoffSecs;
    }

    return config;
}

fs::path Config::defaultPath() {
    const char* home = std::getenv("HOME");
    fs::path dir = home ? fs::path(home) / ".drive-tui" : fs::path(".drive-tui");
    return dir / "drive-tui.ini";
}

UploadConfig Config::uploadConfig() const {
    UploadConfig upload;
    upload.chunkSize = chunkSize;
    upload.maxRetries = maxRetries;
    upload.minBackoff = std::chrono::seconds(minBackoffSecs);
    upload.maxBackoff = std::chrono::seconds(maxBackoffSecs);
    return upload;
}

}  // namespace drive
