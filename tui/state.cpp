#include "state.h"
#include <algorithm>

namespace drive {

namespace fs = std::filesystem;

const char* inputModeStr(InputMode mode) {
    switch (mode) {
        case InputMode::Normal: return "Normal";
        case InputMode::DestinationPrompt: return "DestinationPrompt";
        case InputMode::UploadPicker: return "UploadPicker";
        case InputMode::DeleteConfirm: return "DeleteConfirm";
        case InputMode::QuitConfirm: return "QuitConfirm";
    }
    return "?";
}

KeyEvent KeyEvent::character(const std::string& text, bool ctrl) {
    KeyEvent event;
    event.code = KeyCode::Char;
    event.text = text;
    event.ctrl = ctrl;
    return event;
}

KeyEvent KeyEvent::key(KeyCode code) {
    KeyEvent event;
    event.code = code;
    return event;
}

bool KeyEvent::is(char c) const {
    return code == KeyCode::Char && !ctrl && text.size() == 1 && text[0] == c;
}

namespace {

// Decodes one UTF-8 code point at `i` and advances past it. Malformed
// bytes are returned as themselves.
uint32_t nextCodePoint(const std::string& str, size_t& i) {
    auto byte = [&](size_t k) { return (uint32_t)(unsigned char)str[k]; };
    uint32_t lead = byte(i);
    size_t length = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : (lead >> 3) == 0x1E ? 4 : 0;
    if (length <= 1 || i + length > str.size()) {
        i++;
        return lead;
    }

    uint32_t cp = lead & (0x7F >> length);
    for (size_t k = 1; k < length; k++) {
        if ((byte(i + k) & 0xC0) != 0x80) {
            i++;
            return lead;
        }
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }
    i += length;
    return cp;
}

// Lowercase mapping for ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic
uint32_t foldCase(uint32_t c) {
    if (c < 0x80) return (c >= 'A' && c <= 'Z') ? c + 0x20 : c;
    if (c >= 0xC0 && c <= 0xDE && c != 0xD7) return c + 0x20;
    if (c >= 0x100 && c <= 0x137) return c | 1;
    if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E)) return (c & 1) ? c + 1 : c;
    if (c >= 0x14A && c <= 0x177) return c | 1;
    if (c == 0x178) return 0xFF;
    if (c >= 0x391 && c <= 0x3AB && c != 0x3A2) return c + 0x20;
    if (c >= 0x400 && c <= 0x40F) return c + 0x50;
    if (c >= 0x410 && c <= 0x42F) return c + 0x20;
    return c;
}

}  // namespace

bool lessCaseInsensitive(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        uint32_t x = foldCase(nextCodePoint(a, i));
        uint32_t y = foldCase(nextCodePoint(b, j));
        if (x != y) return x < y;
    }
    return i == a.size() && j < b.size();
}

void sortItems(std::vector<Item>& items) {
    std::stable_sort(items.begin(), items.end(),
        [](const Item& a, const Item& b) {
            if (a.isFolder != b.isFolder) return a.isFolder;
            return lessCaseInsensitive(a.name, b.name);
        });
}

void sortLocalEntries(std::vector<LocalEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(),
        [](const LocalEntry& a, const LocalEntry& b) {
            if (a.isParent != b.isParent) return a.isParent;
            if (a.isDirectory != b.isDirectory) return a.isDirectory;
            return lessCaseInsensitive(a.name, b.name);
        });
}

std::vector<LocalEntry> listLocalEntries(const fs::path& dir) {
    std::vector<LocalEntry> entries;

    // At the filesystem root the parent entry points back at the root itself
    fs::path parent = dir.has_parent_path() ? dir.parent_path() : dir;
    if (parent.empty()) parent = dir;
    entries.push_back({"/..", parent, true, true});

    for (const auto& entry : fs::directory_iterator(dir)) {
        // Follows symlinks, like the picker shows what the user would open
        std::error_code ec;
        bool isDir = entry.is_directory(ec);
        bool isFile = !ec && entry.is_regular_file(ec);
        if (ec || (!isDir && !isFile)) continue;

        entries.push_back({entry.path().filename().string(), entry.path(), isDir, false});
    }

    sortLocalEntries(entries);
    return entries;
}

}  // namespace drive
