#ifndef DRIVE_TUI_FORMAT_H
#define DRIVE_TUI_FORMAT_H

#include <cstdint>
#include <string>

namespace drive {

// "512 B", "1.5 KB", "8.0 MB", "2.3 GB"
std::string formatSize(uint64_t bytes);

}  // namespace drive

#endif  // DRIVE_TUI_FORMAT_H
