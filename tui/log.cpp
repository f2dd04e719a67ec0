#include "log.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace drive {

namespace {

std::shared_ptr<spdlog::logger> makeLogger(spdlog::sink_ptr sink) {
    auto log = std::make_shared<spdlog::logger>("drive", std::move(sink));
    log->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
    return log;
}

std::shared_ptr<spdlog::logger>& instance() {
    static std::shared_ptr<spdlog::logger> log =
        makeLogger(std::make_shared<spdlog::sinks::null_sink_mt>());
    return log;
}

}  // namespace

void initLogging(const std::string& filePath, const std::string& level) {
    spdlog::sink_ptr sink;
    if (filePath.empty()) {
        sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
    }

    auto log = makeLogger(std::move(sink));
    log->set_level(spdlog::level::from_str(level));
    log->flush_on(spdlog::level::warn);
    instance() = log;
}

std::shared_ptr<spdlog::logger> logger() {
    return instance();
}

}  // namespace drive
