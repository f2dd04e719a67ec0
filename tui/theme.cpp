#include "theme.h"

namespace drive {

const std::vector<ColorTheme>& builtinThemes() {
    using ftxui::Color;

    static const std::vector<ColorTheme> themes = {
        // Plain ANSI colors
        {
            "Default",
            Color::Default,   // bg: inherit terminal background
            Color::Default,   // fg: inherit terminal foreground
            Color::Cyan,      // accent
            Color::Blue,      // primary
            Color::White,     // primaryFg
            Color::Green,     // success
            Color::Yellow,    // warning
            Color::Red,       // error
            Color::GrayDark,  // bgDark
        },
        {
            "Dracula",
            Color::RGB(40, 42, 54),     // bg
            Color::RGB(248, 248, 242),  // fg
            Color::RGB(139, 233, 253),  // accent: cyan
            Color::RGB(189, 147, 249),  // primary: purple
            Color::RGB(40, 42, 54),     // primaryFg: bg
            Color::RGB(80, 250, 123),   // success: green
            Color::RGB(241, 250, 140),  // warning: yellow
            Color::RGB(255, 85, 85),    // error: red
            Color::RGB(68, 71, 90),     // bgDark: current-line
        },
        {
            "Gruvbox Dark",
            Color::RGB(40, 40, 40),     // bg: bg0
            Color::RGB(235, 219, 178),  // fg
            Color::RGB(131, 165, 152),  // accent: aqua
            Color::RGB(69, 133, 136),   // primary: dark aqua
            Color::RGB(235, 219, 178),  // primaryFg
            Color::RGB(184, 187, 38),   // success: green
            Color::RGB(250, 189, 47),   // warning: yellow
            Color::RGB(251, 73, 52),    // error: red
            Color::RGB(60, 56, 54),     // bgDark: bg1
        },
        {
            "Nord",
            Color::RGB(46, 52, 64),     // bg: nord0
            Color::RGB(216, 222, 233),  // fg: nord4
            Color::RGB(136, 192, 208),  // accent: nord8
            Color::RGB(94, 129, 172),   // primary: nord10
            Color::RGB(236, 239, 244),  // primaryFg: nord6
            Color::RGB(163, 190, 140),  // success: nord14
            Color::RGB(235, 203, 139),  // warning: nord13
            Color::RGB(191, 97, 106),   // error: nord11
            Color::RGB(59, 66, 82),     // bgDark: nord1
        },
        {
            "Solarized Dark",
            Color::RGB(0, 43, 54),      // bg: base03
            Color::RGB(131, 148, 150),  // fg: base0
            Color::RGB(42, 161, 152),   // accent: cyan
            Color::RGB(38, 139, 210),   // primary: blue
            Color::RGB(238, 232, 213),  // primaryFg: base2
            Color::RGB(133, 153, 0),    // success: green
            Color::RGB(181, 137, 0),    // warning: yellow
            Color::RGB(220, 50, 47),    // error: red
            Color::RGB(7, 54, 66),      // bgDark: base02
        },
    };

    return themes;
}

const ColorTheme& findTheme(const std::string& name) {
    const auto& themes = builtinThemes();
    for (const auto& theme : themes) {
        if (theme.name == name) {
            return theme;
        }
    }
    return themes.front();
}

}  // namespace drive
