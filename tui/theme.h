#ifndef DRIVE_TUI_THEME_H
#define DRIVE_TUI_THEME_H

#include <ftxui/screen/color.hpp>
#include <string>
#include <vector>

namespace drive {

struct ColorTheme {
    std::string name;
    ftxui::Color bg;           // main background
    ftxui::Color fg;           // default text color
    ftxui::Color accent;       // selection marker, folder rows, picker directories
    ftxui::Color primary;      // list title, selected row bg
    ftxui::Color primaryFg;    // selected row text
    ftxui::Color success;      // key hints, progress text
    ftxui::Color warning;      // prompts, confirmation windows, upload hint
    ftxui::Color error;        // error status text
    ftxui::Color bgDark;       // header and footer bg
};

const std::vector<ColorTheme>& builtinThemes();

// Unknown names fall back to the first (Default) theme
const ColorTheme& findTheme(const std::string& name);

}  // namespace drive

#endif  // DRIVE_TUI_THEME_H
