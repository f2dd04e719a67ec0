#include "modal.h"

namespace drive {
namespace components {

using namespace ftxui;

Element ModalFrame(const std::string& title, Element content) {
    return window(text(" " + title + " ") | bold, content) | clear_under | center;
}

Element ConfirmWindow(
    const std::string& title,
    const std::vector<std::string>& lines,
    const ColorTheme& theme
) {
    Elements content;
    for (const auto& line : lines) {
        content.push_back(text(line) | center);
    }
    content.push_back(separator());
    content.push_back(hbox({
        filler(),
        text(" [y] Yes ") | bold | color(theme.success),
        text(" [n] No ") | bold | color(theme.error),
        filler()
    }));

    return ModalFrame(title, vbox(content) | size(WIDTH, GREATER_THAN, 36))
        | color(theme.warning);
}

Element KeyHelpWindow(
    const std::string& title,
    const std::vector<std::pair<std::string, std::string>>& bindings
) {
    Elements lines;
    for (const auto& [key, desc] : bindings) {
        if (key.empty()) {
            lines.push_back(separator());
        } else {
            lines.push_back(hbox({
                text(key) | bold | size(WIDTH, EQUAL, 14),
                text(desc)
            }));
        }
    }

    return ModalFrame(title, vbox(lines) | size(WIDTH, EQUAL, 40));
}

}  // namespace components
}  // namespace drive
