#ifndef DRIVE_TUI_NAVIGATOR_H
#define DRIVE_TUI_NAVIGATOR_H

#include "state.h"
#include "config.h"
#include "picker.h"
#include "core/hub.h"
#include "core/transfer_jobs.h"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace drive {

// Navigation state machine: folder stack, listing, input modes and the
// two transfer slots. Only ever touched from the UI thread.
class Navigator {
public:
    Navigator(Hub& hub, const Config& config);

    // Fetches the current folder. On failure the previous listing is kept,
    // the status reads "Error: <e>" and false is returned.
    bool reload();

    // Dispatches a key to the active mode. Returns true when the
    // application should quit right away (no transfer running).
    bool handleKey(const KeyEvent& key);

    // Blink timer and job reconciliation, called every loop iteration
    void tick(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Status line: job progress when a job runs, else the last status
    std::string renderStatus() const;

    // Cancels every job; the exit happens once both slots are empty
    void requestExit();
    bool exitRequested() const { return exitRequested_; }
    bool shouldExit() const { return exitRequested_ && transfers_.idle(); }
    bool hasActiveTransfer() const { return !transfers_.idle(); }

    // Directory the upload picker opens at, the working directory by default
    void setPickerStartDir(const std::filesystem::path& dir) { pickerStartDir_ = dir; }

    // Row 0 is the parent marker, rows 1..n are items()
    std::vector<ListingRow> rows() const;
    const std::vector<Item>& items() const { return items_; }
    int selected() const { return selected_; }

    InputMode mode() const { return mode_; }
    const FolderFrame& current() const { return current_; }
    size_t depth() const { return folderStack_.size(); }
    const std::string& status() const { return status_; }
    const std::string& input() const { return input_; }
    const UploadPicker* picker() const { return picker_ ? &*picker_ : nullptr; }
    const std::optional<Item>& pendingDelete() const { return pendingDelete_; }
    bool blinkOn() const { return blinkOn_; }

    TransferEngine& transfers() { return transfers_; }
    const TransferEngine& transfers() const { return transfers_; }

private:
    bool handleNormalKey(const KeyEvent& key);
    void handlePromptKey(const KeyEvent& key);
    void handlePickerKey(const KeyEvent& key);
    void handleDeleteConfirmKey(const KeyEvent& key);
    void handleQuitConfirmKey(const KeyEvent& key);

    // Empty on success, else the listing error
    std::optional<std::string> fetchListing();

    void selectNext();
    void selectPrevious();
    void openSelected();
    void goBack();

    void startInput(InputMode mode, const std::string& status);
    void cancelInput(const std::string& status);
    void startUploadPicker();
    void startDeleteConfirm();
    void startDownload(const std::optional<std::filesystem::path>& destination);
    void startUpload(const std::filesystem::path& path);
    void changePickerDir(const std::filesystem::path& dir);

    void onCompletion(const JobCompletion& completion);

    // Selected remote item, nullptr on the parent row
    const Item* selectedItem() const;

    Hub& hub_;
    size_t maxFiles_;
    std::chrono::milliseconds blinkInterval_;

    std::vector<Item> items_;
    int selected_ = 0;
    std::vector<FolderFrame> folderStack_;
    FolderFrame current_{std::nullopt, "root"};

    std::string status_ = "Ready";
    InputMode mode_ = InputMode::Normal;
    std::string input_;
    std::optional<UploadPicker> picker_;
    std::optional<std::filesystem::path> pickerStartDir_;
    std::optional<Item> pendingDelete_;
    bool exitRequested_ = false;

    bool blinkOn_ = true;
    std::chrono::steady_clock::time_point lastBlink_;

    TransferEngine transfers_;
};

}  // namespace drive

#endif  // DRIVE_TUI_NAVIGATOR_H
