#include "navigator.h"
#include "format.h"
#include "log.h"
#include <system_error>
#include <utility>

namespace drive {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Removes the last UTF-8 code point
void popCodePoint(std::string& str) {
    while (!str.empty() && ((unsigned char)str.back() & 0xC0) == 0x80) {
        str.pop_back();
    }
    if (!str.empty()) {
        str.pop_back();
    }
}

bool isBack(const KeyEvent& key) {
    return key.code == KeyCode::Left || key.is('b');
}

}  // namespace

Navigator::Navigator(Hub& hub, const Config& config)
    : hub_(hub),
      maxFiles_(config.maxFiles),
      blinkInterval_(config.blinkInterval()),
      lastBlink_(std::chrono::steady_clock::now()),
      transfers_(hub, config.uploadConfig()) {}

std::optional<std::string> Navigator::fetchListing() {
    ListScope scope = current_.id ? ListScope::children(*current_.id) : ListScope::root();

    std::vector<RemoteFile> files;
    try {
        files = hub_.list(scope, maxFiles_);
    } catch (const HubError& e) {
        logger()->warn("[NAV] Listing '{}' failed: {}", current_.name, e.what());
        return std::string(e.what());
    }

    std::vector<Item> items;
    items.reserve(files.size());
    for (const auto& file : files) {
        Item item;
        item.id = file.id;
        item.name = file.name.empty() ? "<unnamed>" : file.name;
        item.isFolder = file.isFolder;
        item.size = file.size;
        items.push_back(std::move(item));
    }
    sortItems(items);

    items_ = std::move(items);
    selected_ = 0;
    logger()->debug("[NAV] Listed '{}' ({} items)", current_.name, items_.size());
    return std::nullopt;
}

bool Navigator::reload() {
    auto error = fetchListing();
    if (error) {
        status_ = "Error: " + *error;
        return false;
    }
    status_ = "Ready";
    return true;
}

std::vector<ListingRow> Navigator::rows() const {
    std::vector<ListingRow> rows;
    rows.reserve(items_.size() + 1);
    rows.push_back({true, nullptr});
    for (const auto& item : items_) {
        rows.push_back({false, &item});
    }
    return rows;
}

const Item* Navigator::selectedItem() const {
    if (selected_ <= 0 || selected_ > (int)items_.size()) {
        return nullptr;
    }
    return &items_[selected_ - 1];
}

bool Navigator::handleKey(const KeyEvent& key) {
    switch (mode_) {
        case InputMode::Normal:
            return handleNormalKey(key);
        case InputMode::DestinationPrompt:
            handlePromptKey(key);
            break;
        case InputMode::UploadPicker:
            handlePickerKey(key);
            break;
        case InputMode::DeleteConfirm:
            handleDeleteConfirmKey(key);
            break;
        case InputMode::QuitConfirm:
            handleQuitConfirmKey(key);
            break;
    }
    return false;
}

bool Navigator::handleNormalKey(const KeyEvent& key) {
    if (key.is('q')) {
        if (transfers_.idle()) {
            return true;
        }
        mode_ = InputMode::QuitConfirm;
        status_ = "Confirm quit";
        return false;
    }

    if (key.is('r')) {
        reload();
    } else if (isBack(key)) {
        goBack();
    } else if (key.is('d')) {
        startInput(InputMode::DestinationPrompt, "Download destination (dir)");
    } else if (key.is('u')) {
        startUploadPicker();
    } else if (key.is('x') || key.code == KeyCode::Delete) {
        startDeleteConfirm();
    } else if (key.code == KeyCode::Up) {
        selectPrevious();
    } else if (key.code == KeyCode::Down) {
        selectNext();
    } else if (key.code == KeyCode::Enter || key.code == KeyCode::Right) {
        openSelected();
    }
    return false;
}

void Navigator::handlePromptKey(const KeyEvent& key) {
    switch (key.code) {
        case KeyCode::Escape:
            cancelInput("Cancelled");
            break;
        case KeyCode::Enter: {
            std::string value = trim(input_);
            input_.clear();
            mode_ = InputMode::Normal;
            std::optional<fs::path> destination;
            if (!value.empty()) {
                destination = fs::path(value);
            }
            startDownload(destination);
            break;
        }
        case KeyCode::Backspace:
            popCodePoint(input_);
            break;
        case KeyCode::Char:
            // Control chords would insert control codes
            if (!key.ctrl) {
                input_ += key.text;
            }
            break;
        default:
            break;
    }
}

void Navigator::handlePickerKey(const KeyEvent& key) {
    if (!picker_) {
        cancelInput("Upload picker closed");
        return;
    }

    if (key.code == KeyCode::Escape || key.is('q')) {
        cancelInput("Upload cancelled");
    } else if (isBack(key)) {
        fs::path dir = picker_->currentDir();
        if (dir.has_parent_path() && dir.parent_path() != dir) {
            changePickerDir(dir.parent_path());
        }
    } else if (key.code == KeyCode::Right) {
        const LocalEntry* entry = picker_->highlighted();
        if (entry && entry->isDirectory) {
            changePickerDir(entry->path);
        }
    } else if (key.code == KeyCode::Up) {
        picker_->selectPrevious();
    } else if (key.code == KeyCode::Down) {
        picker_->selectNext();
    } else if (key.code == KeyCode::Enter) {
        const LocalEntry* entry = picker_->highlighted();
        if (!entry) {
            return;
        }
        if (entry->isDirectory) {
            changePickerDir(entry->path);
        } else {
            picker_->mark(entry->path);
            status_ = "Selected " + entry->name;
        }
    } else if (key.is('u')) {
        auto target = picker_->uploadTarget();
        if (!target) {
            status_ = "No selection to upload";
            return;
        }
        mode_ = InputMode::Normal;
        picker_.reset();
        startUpload(*target);
    }
}

void Navigator::handleDeleteConfirmKey(const KeyEvent& key) {
    if (key.code == KeyCode::Escape || key.is('q') || key.is('n') || key.is('N')) {
        pendingDelete_.reset();
        mode_ = InputMode::Normal;
        status_ = "Delete cancelled";
        return;
    }
    if (!key.is('y') && !key.is('Y')) {
        return;
    }

    mode_ = InputMode::Normal;
    if (!pendingDelete_) {
        status_ = "Nothing to delete";
        return;
    }

    Item item = *pendingDelete_;
    pendingDelete_.reset();
    try {
        hub_.remove(item.id, item.isFolder);
    } catch (const HubError& e) {
        logger()->warn("[NAV] Delete of '{}' failed: {}", item.name, e.what());
        status_ = std::string("Delete failed: ") + e.what();
        return;
    }

    logger()->info("[NAV] Deleted '{}' ({})", item.name, item.id);
    if (reload()) {
        status_ = "Delete completed";
    }
}

void Navigator::handleQuitConfirmKey(const KeyEvent& key) {
    mode_ = InputMode::Normal;
    if (key.is('y') || key.is('Y')) {
        requestExit();
    } else {
        status_ = "Quit cancelled";
    }
}

void Navigator::selectNext() {
    int count = (int)items_.size() + 1;
    selected_ = (selected_ + 1) % count;
}

void Navigator::selectPrevious() {
    int count = (int)items_.size() + 1;
    selected_ = selected_ == 0 ? count - 1 : selected_ - 1;
}

void Navigator::openSelected() {
    if (selected_ == 0) {
        goBack();
        return;
    }
    const Item* item = selectedItem();
    if (!item) {
        status_ = "No selection";
        return;
    }
    if (!item->isFolder) {
        status_ = "Not a folder";
        return;
    }
    if (item->id.empty()) {
        status_ = "Missing folder id";
        return;
    }

    FolderFrame previous = current_;
    folderStack_.push_back(previous);
    current_ = {item->id, item->name};

    if (!reload()) {
        // Keep depth in line with what is on screen
        folderStack_.pop_back();
        current_ = previous;
        return;
    }
    logger()->debug("[NAV] Opened '{}' (depth {})", current_.name, folderStack_.size());
}

void Navigator::goBack() {
    if (folderStack_.empty()) {
        status_ = "Already at root";
        return;
    }

    FolderFrame left = current_;
    current_ = folderStack_.back();
    folderStack_.pop_back();

    if (!reload()) {
        folderStack_.push_back(current_);
        current_ = left;
        return;
    }
    logger()->debug("[NAV] Back to '{}' (depth {})", current_.name, folderStack_.size());
}

void Navigator::startInput(InputMode mode, const std::string& status) {
    mode_ = mode;
    input_.clear();
    status_ = status;
}

void Navigator::cancelInput(const std::string& status) {
    mode_ = InputMode::Normal;
    input_.clear();
    status_ = status;
    picker_.reset();
}

void Navigator::startUploadPicker() {
    fs::path dir;
    if (pickerStartDir_) {
        dir = *pickerStartDir_;
    } else {
        std::error_code ec;
        dir = fs::current_path(ec);
        if (ec) dir = ".";
    }

    try {
        picker_.emplace(dir);
    } catch (const fs::filesystem_error& e) {
        status_ = std::string("Failed to open upload picker: ") + e.what();
        return;
    }
    input_.clear();
    mode_ = InputMode::UploadPicker;
    status_ = "Upload picker";
}

void Navigator::changePickerDir(const fs::path& dir) {
    try {
        picker_->changeDir(dir);
    } catch (const fs::filesystem_error& e) {
        logger()->warn("[NAV] Cannot list '{}': {}", dir.string(), e.what());
        status_ = std::string("Error: ") + e.what();
    }
}

void Navigator::startDeleteConfirm() {
    if (selected_ == 0) {
        status_ = "Cannot delete parent entry";
        return;
    }
    const Item* item = selectedItem();
    if (!item) {
        status_ = "No selection";
        return;
    }
    if (item->id.empty()) {
        status_ = "Missing file id";
        return;
    }
    pendingDelete_ = *item;
    mode_ = InputMode::DeleteConfirm;
    status_ = "Confirm delete";
}

void Navigator::startDownload(const std::optional<fs::path>& destination) {
    if (transfers_.downloadActive()) {
        status_ = "Download already in progress";
        return;
    }
    const Item* item = selectedItem();
    if (!item) {
        // The parent row is a folder affordance
        status_ = selected_ == 0 ? "Select a file to download" : "No selection";
        return;
    }

    auto error = transfers_.startDownload(*item, destination);
    if (error) {
        logger()->info("[NAV] Download of '{}' rejected: {}", item->name, *error);
        status_ = *error;
        return;
    }
    status_ = "Download started";
}

void Navigator::startUpload(const fs::path& path) {
    auto error = transfers_.startUpload(path, current_.id);
    if (error) {
        logger()->info("[NAV] Upload of '{}' rejected: {}", path.string(), *error);
        status_ = *error;
        return;
    }
    status_ = "Upload started";
}

void Navigator::requestExit() {
    exitRequested_ = true;
    transfers_.cancelAll();
    logger()->info("[NAV] Exit requested");
}

void Navigator::tick(std::chrono::steady_clock::time_point now) {
    if (now - lastBlink_ >= blinkInterval_) {
        blinkOn_ = !blinkOn_;
        lastBlink_ = now;
    }

    for (const auto& completion : transfers_.reconcile()) {
        onCompletion(completion);
    }
}

void Navigator::onCompletion(const JobCompletion& completion) {
    const JobOutcome& outcome = completion.outcome;

    if (completion.kind == JobKind::Upload) {
        if (outcome.ok) {
            // Fresh listing so the new entries show up
            auto error = fetchListing();
            status_ = error ? "Upload completed (refresh failed: " + *error + ")" : "Upload completed";
        } else if (outcome.cancelled()) {
            status_ = "Upload cancelled";
        } else {
            status_ = "Upload failed: " + outcome.error;
        }
        return;
    }

    if (outcome.ok) {
        status_ = "Download completed";
    } else if (outcome.cancelled()) {
        status_ = "Download cancelled";
    } else if (outcome.kind == TransferError::Kind::Integrity) {
        status_ = "Integrity check failed: " + outcome.error;
    } else {
        status_ = "Download failed: " + outcome.error;
    }
}

std::string Navigator::renderStatus() const {
    if (transfers_.uploadCancelRequested()) return "Cancelling upload...";
    if (const UploadProgress* progress = transfers_.uploadProgress()) {
        if (progress->totalFiles) {
            std::string file = progress->currentFile.value_or("<unknown>");
            if (progress->totalBytes) {
                file += " (" + formatSize(progress->currentBytes) + "/" +
                    formatSize(*progress->totalBytes) + ")";
            }
            return "Uploading " + file + " [" + std::to_string(progress->doneFiles) + "/" +
                std::to_string(*progress->totalFiles) + "]";
        }
        if (progress->totalBytes) {
            return "Uploading (" + formatSize(progress->currentBytes) + "/" +
                formatSize(*progress->totalBytes) + ")";
        }
        return "Uploading...";
    }

    if (transfers_.downloadCancelRequested()) return "Cancelling download...";
    if (const DownloadProgress* progress = transfers_.downloadProgress()) {
        if (progress->totalBytes) {
            return "Downloading " + progress->fileName + " (" + formatSize(progress->currentBytes) +
                "/" + formatSize(*progress->totalBytes) + ")";
        }
        return "Downloading " + progress->fileName + " (" + formatSize(progress->currentBytes) + ")";
    }

    return status_;
}

}  // namespace drive
