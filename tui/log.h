#ifndef DRIVE_TUI_LOG_H
#define DRIVE_TUI_LOG_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace drive {

// Replaces the process logger. With an empty `filePath` everything is
// discarded, since the terminal belongs to the UI. Call before any
// transfer job starts.
void initLogging(const std::string& filePath, const std::string& level);

// Process logger, a null sink until initLogging() is called
std::shared_ptr<spdlog::logger> logger();

}  // namespace drive

#endif  // DRIVE_TUI_LOG_H
