#include "table.h"

namespace drive {
namespace components {

using namespace ftxui;

std::string fitToWidth(const std::string& str, int width) {
    if (width <= 0 || (int)str.length() <= width) return str;
    if (width > 3) {
        return str.substr(0, width - 3) + "...";
    }
    return str.substr(0, width);
}

Element ListElement(
    const std::vector<ListEntry>& entries,
    int selected,
    const ColorTheme& theme
) {
    Elements rowElements;

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        bool isSelected = (int)i == selected;

        auto marker = isSelected ? text("▸ ") | color(theme.accent) : text("  ");
        auto label = text(entry.label);
        if (entry.emphasized) {
            label = label | bold | color(theme.accent);
        }

        Element rowElem = hbox({marker, label, filler()});
        if (isSelected) {
            // focus makes the yframe scroll to this row
            rowElem = rowElem | bgcolor(theme.primary) | color(theme.primaryFg) | focus;
        }
        rowElements.push_back(rowElem);
    }

    if (entries.empty()) {
        rowElements.push_back(text("  (empty)") | dim);
    }

    return vbox(rowElements) | vscroll_indicator | yframe;
}

}  // namespace components
}  // namespace drive
