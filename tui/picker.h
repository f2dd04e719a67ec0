#ifndef DRIVE_TUI_PICKER_H
#define DRIVE_TUI_PICKER_H

#include "state.h"
#include <filesystem>
#include <optional>
#include <vector>

namespace drive {

// Local filesystem browser used to choose what to upload
class UploadPicker {
public:
    // Throws std::filesystem::filesystem_error when `dir` cannot be listed
    explicit UploadPicker(const std::filesystem::path& dir);

    const std::filesystem::path& currentDir() const { return currentDir_; }
    const std::vector<LocalEntry>& entries() const { return entries_; }
    int selected() const { return selected_; }
    const LocalEntry* highlighted() const;

    // Explicitly marked entry, set with Enter on a file
    const std::optional<std::filesystem::path>& marked() const { return marked_; }
    void mark(const std::filesystem::path& path) { marked_ = path; }

    void selectNext();
    void selectPrevious();

    // Lists `dir` and resets the highlight. On failure nothing changes.
    // Throws std::filesystem::filesystem_error.
    void changeDir(const std::filesystem::path& dir);

    // The marked entry, else the highlighted one. The parent row is never
    // an upload target.
    std::optional<std::filesystem::path> uploadTarget() const;

private:
    std::filesystem::path currentDir_;
    std::vector<LocalEntry> entries_;
    int selected_ = 0;
    std::optional<std::filesystem::path> marked_;
};

}  // namespace drive

#endif  // DRIVE_TUI_PICKER_H
