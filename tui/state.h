#ifndef DRIVE_TUI_STATE_H
#define DRIVE_TUI_STATE_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace drive {

// Input modes of the navigation state machine
enum class InputMode {
    Normal,
    DestinationPrompt,
    UploadPicker,
    DeleteConfirm,
    QuitConfirm
};

const char* inputModeStr(InputMode mode);

// Keys the state machine understands, independent of the terminal toolkit
enum class KeyCode {
    Char,
    Enter,
    Escape,
    Backspace,
    Delete,
    Up,
    Down,
    Left,
    Right,
    Other
};

struct KeyEvent {
    KeyCode code = KeyCode::Other;
    std::string text;   // UTF-8 sequence for KeyCode::Char
    bool ctrl = false;

    static KeyEvent character(const std::string& text, bool ctrl = false);
    static KeyEvent key(KeyCode code);

    bool is(char c) const;
};

// Remote listing row
struct Item {
    std::string id;     // may be empty when the service omitted it
    std::string name;
    bool isFolder = false;
    std::optional<uint64_t> size;
};

// One visible row of a listing. The parent marker is not an Item; it is
// always row 0 and is derived from the view, not from the remote data.
struct ListingRow {
    bool isParent = false;
    const Item* item = nullptr;
};

// Folder navigation frame (empty id = root)
struct FolderFrame {
    std::optional<std::string> id;
    std::string name;
};

// Local filesystem entry for the upload picker
struct LocalEntry {
    std::string name;
    std::filesystem::path path;
    bool isDirectory = false;
    bool isParent = false;
};

// Folders before files, then case-insensitive name. Stable for equal keys.
void sortItems(std::vector<Item>& items);

// Parent marker first, then directories before files, then case-insensitive name.
void sortLocalEntries(std::vector<LocalEntry>& entries);

// Lists regular files and directories of `dir` plus a leading "/.." entry.
// Throws std::filesystem::filesystem_error.
std::vector<LocalEntry> listLocalEntries(const std::filesystem::path& dir);

// Compares UTF-8 names code point by code point after lowercasing Latin,
// Greek and Cyrillic letters; other scripts compare as they are
bool lessCaseInsensitive(const std::string& a, const std::string& b);

}  // namespace drive

#endif  // DRIVE_TUI_STATE_H
