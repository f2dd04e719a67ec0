#ifndef DRIVE_TUI_COMPONENTS_TABLE_H
#define DRIVE_TUI_COMPONENTS_TABLE_H

#include "../theme.h"
#include <ftxui/dom/elements.hpp>
#include <string>
#include <vector>

namespace drive {
namespace components {

struct ListEntry {
    std::string label;
    bool emphasized = false;   // drawn in the accent color (folders, parent row)
};

// Scrollable single-column list with a highlighted row. The selected row
// is focused so the surrounding frame scrolls to it.
ftxui::Element ListElement(
    const std::vector<ListEntry>& entries,
    int selected,
    const ColorTheme& theme
);

// Truncates to `width` columns with a trailing "..."
std::string fitToWidth(const std::string& str, int width);

}  // namespace components
}  // namespace drive

#endif  // DRIVE_TUI_COMPONENTS_TABLE_H
