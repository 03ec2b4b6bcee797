#include "tui.hpp"
#include "ftxui_terminal.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>
#include <utility>

TerminalUi::TerminalUi(Terminal& terminal, size_t num_results, History history)
    : terminal_(terminal),
      history_(std::move(history)),
      session_(history_, num_results),
      renderer_(terminal) {
    spdlog::debug("Initialize UI");
    terminal_.enterInteractive();
    active_ = true;
}

TerminalUi::~TerminalUi() {
    try {
        cleanup();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to restore terminal: {}", e.what());
    }
}

void TerminalUi::cleanup() {
    if (!active_) return;
    active_ = false;
    spdlog::debug("Cleanup UI");
    terminal_.resetColor();
    terminal_.leaveInteractive();
}

std::optional<std::string> TerminalUi::run(const std::optional<std::string>& initial_term) {
    spdlog::debug("Run UI");

    // 1. Initial ranking and frame
    session_.start(initial_term);
    renderer_.drawMatches(session_);

    // 2. Event loop
    while (true) {
        ftxui::Event event = terminal_.nextEvent();

        switch (session_.handleEvent(event)) {
            case KeyAction::SELECT:
                cleanup();
                return session_.selection();
            case KeyAction::EXIT:
                cleanup();
                return std::nullopt;
            case KeyAction::REDRAW:
                renderer_.drawMatches(session_);
                break;
            case KeyAction::CONTINUE:
                break;
        }

        // Keep the loop from spinning between polls
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<std::string> run_search_ui(History history, size_t num_results,
                                         const std::optional<std::string>& initial_term) {
    FtxuiTerminal terminal;
    TerminalUi ui(terminal, num_results, std::move(history));
    return ui.run(initial_term);
}
