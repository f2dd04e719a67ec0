#ifndef DRIVE_TUI_COMPONENTS_MODAL_H
#define DRIVE_TUI_COMPONENTS_MODAL_H

#include "../theme.h"
#include <ftxui/dom/elements.hpp>
#include <string>
#include <utility>
#include <vector>

namespace drive {
namespace components {

// Centered window drawn over whatever is below it
ftxui::Element ModalFrame(
    const std::string& title,
    ftxui::Element content
);

// Yes/no question answered with the y and n keys
ftxui::Element ConfirmWindow(
    const std::string& title,
    const std::vector<std::string>& lines,
    const ColorTheme& theme
);

// Two-column key binding reference
ftxui::Element KeyHelpWindow(
    const std::string& title,
    const std::vector<std::pair<std::string, std::string>>& bindings
);

}  // namespace components
}  // namespace drive

#endif  // DRIVE_TUI_COMPONENTS_MODAL_H
