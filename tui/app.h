#ifndef DRIVE_TUI_APP_H
#define DRIVE_TUI_APP_H

#include "config.h"
#include "navigator.h"
#include "theme.h"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <atomic>
#include <chrono>

namespace drive {

class App {
public:
    App(Navigator& navigator, const Config& config);
    ~App();

    // Run the application (blocking). Returns once the navigator allows
    // the exit, which waits for cancelled transfers to wind down.
    void run();

    // Thread-safe and async-signal-safe: behaves like a confirmed quit
    void requestQuit();

private:
    // Build the main UI component
    ftxui::Component buildUI();

    ftxui::Element buildHeader();
    ftxui::Element buildListing();
    ftxui::Element buildFooter();

    // Overlays, emptyElement() when not shown
    ftxui::Element buildPickerOverlay();
    ftxui::Element buildConfirmOverlay();
    ftxui::Element buildHelpOverlay();

    // Handle key events
    bool handleEvent(ftxui::Event event);

    Navigator& navigator_;
    const ColorTheme& theme_;
    std::chrono::milliseconds pollInterval_;
    ftxui::ScreenInteractive screen_;
    std::atomic<bool> running_{true};
    std::atomic<bool> quitRequested_{false};

    // Help overlay
    bool showHelp_ = false;
};

}  // namespace drive

#endif  // DRIVE_TUI_APP_H
