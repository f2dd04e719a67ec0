#include "app.h"
#include "components/table.h"
#include "components/modal.h"
#include "format.h"
#include "log.h"
#include "ticker.h"

#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/component/loop.hpp>

#include <filesystem>
#include <optional>
#include <thread>

namespace drive {

using namespace ftxui;

namespace {

std::optional<KeyEvent> toKeyEvent(const Event& event) {
    if (event == Event::Return) return KeyEvent::key(KeyCode::Enter);
    if (event == Event::Escape) return KeyEvent::key(KeyCode::Escape);
    if (event == Event::Backspace) return KeyEvent::key(KeyCode::Backspace);
    if (event == Event::Delete) return KeyEvent::key(KeyCode::Delete);
    if (event == Event::ArrowUp) return KeyEvent::key(KeyCode::Up);
    if (event == Event::ArrowDown) return KeyEvent::key(KeyCode::Down);
    if (event == Event::ArrowLeft) return KeyEvent::key(KeyCode::Left);
    if (event == Event::ArrowRight) return KeyEvent::key(KeyCode::Right);

    // Ctrl+<letter> arrives as a single control byte
    const std::string& input = event.is_character() ? event.character() : event.input();
    if (input.size() == 1 && (unsigned char)input[0] < 0x20) {
        return KeyEvent::character(input, true);
    }
    if (event.is_character()) {
        return KeyEvent::character(input);
    }
    return std::nullopt;
}

bool looksLikeError(const std::string& status) {
    return status.rfind("Error", 0) == 0 ||
        status.find("failed") != std::string::npos ||
        status.rfind("Integrity", 0) == 0;
}

std::string currentDirString() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

Element keyHint(const std::string& key, const std::string& action, const ColorTheme& theme) {
    return hbox({
        text(" " + key) | bold | color(theme.success),
        text(" : " + action + "  ") | dim
    });
}

}  // namespace

App::App(Navigator& navigator, const Config& config)
    : navigator_(navigator),
      theme_(findTheme(config.theme)),
      pollInterval_(config.pollInterval()),
      screen_(ScreenInteractive::Fullscreen()) {}

App::~App() {
    running_ = false;
}

void App::requestQuit() {
    quitRequested_ = true;
}

void App::run() {
    auto ui = buildUI();

    // Wakes the loop so job progress and completion show without input
    running_ = true;
    TickerThread ticker(running_, [this] {
        std::this_thread::sleep_for(pollInterval_);
        screen_.PostEvent(Event::Custom);
    });

    logger()->info("[UI] Started, theme '{}'", theme_.name);

    Loop loop(&screen_, ui);
    bool exiting = false;
    while (!loop.HasQuitted()) {
        if (quitRequested_.exchange(false)) {
            navigator_.requestExit();
        }
        navigator_.tick();
        if (navigator_.shouldExit() && !exiting) {
            exiting = true;
            screen_.Exit();
        }
        loop.RunOnceBlocking();
    }

    ticker.stop();
    logger()->info("[UI] Stopped");
}

Element App::buildHeader() {
    std::string name = navigator_.current().name;
    std::string depth = navigator_.depth() > 0
        ? " depth " + std::to_string(navigator_.depth()) + " "
        : " ";

    return hbox({
        text(" Folder: "),
        text(name) | bold | color(theme_.accent),
        filler(),
        text(depth) | dim,
        text(" drive-tui ") | bold
    }) | bgcolor(theme_.bgDark);
}

Element App::buildListing() {
    std::vector<components::ListEntry> entries;
    for (const auto& row : navigator_.rows()) {
        if (row.isParent) {
            entries.push_back({"/..", true});
        } else if (row.item->isFolder) {
            entries.push_back({"[DIR] " + row.item->name, true});
        } else if (row.item->size) {
            entries.push_back({row.item->name + " (" + formatSize(*row.item->size) + ")", false});
        } else {
            entries.push_back({row.item->name, false});
        }
    }

    return window(
        text(" Drive ") | bold | color(theme_.primary),
        components::ListElement(entries, navigator_.selected(), theme_)
    );
}

Element App::buildFooter() {
    Elements lines;

    switch (navigator_.mode()) {
        case InputMode::DestinationPrompt:
            lines.push_back(hbox({
                text(" Download to dir (empty = " + currentDirString() + "): ") | color(theme_.warning),
                text(navigator_.input()),
                text(" ") | inverted
            }));
            lines.push_back(hbox({
                keyHint("Enter", "start download", theme_),
                keyHint("Esc", "cancel", theme_),
                filler()
            }));
            break;

        case InputMode::UploadPicker: {
            const UploadPicker* picker = navigator_.picker();
            std::string marked = "<none>";
            if (picker && picker->marked()) {
                marked = picker->marked()->filename().string();
            }
            Elements selection = {text(" Selected: "), text(marked) | bold};
            if (picker && picker->marked() && navigator_.blinkOn()) {
                selection.push_back(text("  press u to start uploading") | bold | color(theme_.warning));
            }
            lines.push_back(hbox(selection));
            lines.push_back(hbox({
                keyHint("↑/↓", "move", theme_),
                keyHint("Enter", "open/select", theme_),
                keyHint("→", "open", theme_),
                keyHint("←/b", "up", theme_),
                keyHint("u", "upload", theme_),
                keyHint("Esc/q", "cancel", theme_),
                filler()
            }));
            break;
        }

        default: {
            std::string status = navigator_.renderStatus();
            auto statusText = text(" " + status);
            if (looksLikeError(status)) {
                statusText = statusText | color(theme_.error);
            }
            lines.push_back(hbox({statusText, filler()}));
            lines.push_back(hbox({
                keyHint("Enter/→", "open", theme_),
                keyHint("←/b", "back", theme_),
                keyHint("d", "download", theme_),
                keyHint("u", "upload menu", theme_),
                keyHint("x", "delete", theme_),
                keyHint("r", "refresh", theme_),
                keyHint("q", "quit", theme_),
                keyHint("?", "help", theme_),
                filler()
            }));
            break;
        }
    }

    return vbox(lines) | bgcolor(theme_.bgDark);
}

Element App::buildPickerOverlay() {
    const UploadPicker* picker = navigator_.picker();
    if (navigator_.mode() != InputMode::UploadPicker || !picker) {
        return emptyElement();
    }

    std::vector<components::ListEntry> entries;
    for (const auto& entry : picker->entries()) {
        std::string label;
        if (entry.isParent) {
            label = entry.name;
        } else if (entry.isDirectory) {
            label = "[DIR] " + entry.name;
        } else {
            label = entry.name;
        }
        if (picker->marked() && *picker->marked() == entry.path) {
            label = "* " + label;
        }
        entries.push_back({label, entry.isDirectory});
    }

    std::string title = "Upload from " + components::fitToWidth(picker->currentDir().string(), 60);
    return components::ModalFrame(title,
        components::ListElement(entries, picker->selected(), theme_)
            | size(HEIGHT, LESS_THAN, 20) | size(WIDTH, GREATER_THAN, 60));
}

Element App::buildConfirmOverlay() {
    if (navigator_.mode() == InputMode::DeleteConfirm && navigator_.pendingDelete()) {
        const Item& item = *navigator_.pendingDelete();
        std::vector<std::string> lines = {"Delete " + item.name + "?"};
        if (item.isFolder) {
            lines.push_back("The folder and everything in it will be removed.");
        }
        return components::ConfirmWindow("Confirm delete", lines, theme_);
    }

    if (navigator_.mode() == InputMode::QuitConfirm) {
        return components::ConfirmWindow("Confirm quit", {
            "There are active transfers.",
            "Quit and cancel them?"
        }, theme_);
    }

    return emptyElement();
}

Element App::buildHelpOverlay() {
    return components::KeyHelpWindow("Keys", {
        {"↑/↓", "Move selection"},
        {"Enter/→", "Open folder"},
        {"←/b", "Parent folder"},
        {"r", "Refresh listing"},
        {"", ""},
        {"d", "Download selected file"},
        {"u", "Upload file or folder"},
        {"x/Del", "Delete selected item"},
        {"", ""},
        {"q", "Quit"},
        {"?", "Toggle help"},
    });
}

bool App::handleEvent(Event event) {
    if (event == Event::Custom || event.is_mouse()) {
        return false;
    }

    // Any key closes the help overlay
    if (showHelp_) {
        showHelp_ = false;
        return true;
    }
    if (navigator_.mode() == InputMode::Normal && event == Event::Character('?')) {
        showHelp_ = true;
        return true;
    }

    auto key = toKeyEvent(event);
    if (!key) {
        return false;
    }

    InputMode before = navigator_.mode();
    if (navigator_.handleKey(*key)) {
        logger()->info("[UI] Quit");
        screen_.Exit();
        return true;
    }
    if (navigator_.mode() != before) {
        logger()->debug("[UI] Mode {} -> {}", inputModeStr(before), inputModeStr(navigator_.mode()));
    }
    return true;
}

Component App::buildUI() {
    auto renderer = Renderer([this] {
        auto mainLayout = vbox({
            buildHeader(),
            buildListing() | flex,
            buildFooter(),
        }) | bgcolor(theme_.bg) | color(theme_.fg);

        Element help = showHelp_ ? buildHelpOverlay() : emptyElement();

        // Layer overlays on top using dbox (depth box)
        return dbox({
            mainLayout,
            buildPickerOverlay(),
            buildConfirmOverlay(),
            help,
        });
    });

    return CatchEvent(renderer, [this](Event event) {
        return handleEvent(event);
    });
}

}  // namespace drive
