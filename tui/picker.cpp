#include "picker.h"
#include <utility>

namespace drive {

namespace fs = std::filesystem;

UploadPicker::UploadPicker(const fs::path& dir)
    : currentDir_(dir), entries_(listLocalEntries(dir)) {}

const LocalEntry* UploadPicker::highlighted() const {
    if (selected_ < 0 || selected_ >= (int)entries_.size()) {
        return nullptr;
    }
    return &entries_[selected_];
}

void UploadPicker::selectNext() {
    if (entries_.empty()) return;
    selected_ = (selected_ + 1) % (int)entries_.size();
}

void UploadPicker::selectPrevious() {
    if (entries_.empty()) return;
    selected_ = selected_ == 0 ? (int)entries_.size() - 1 : selected_ - 1;
}

void UploadPicker::changeDir(const fs::path& dir) {
    auto entries = listLocalEntries(dir);
    currentDir_ = dir;
    entries_ = std::move(entries);
    selected_ = 0;
}

std::optional<fs::path> UploadPicker::uploadTarget() const {
    if (marked_) {
        return marked_;
    }
    const LocalEntry* entry = highlighted();
    if (!entry || entry->isParent) {
        return std::nullopt;
    }
    return entry->path;
}

}  // namespace drive
