#pragma once
#include "history.hpp"
#include "renderer.hpp"
#include "session.hpp"
#include "terminal.hpp"
#include <optional>
#include <string>

// One interactive search run on a terminal.
// The constructor enters interactive mode (throws TerminalError on failure);
// cleanup() restores the terminal exactly once, and the destructor calls it
// on every other exit path.
class TerminalUi {
public:
    TerminalUi(Terminal& terminal, size_t num_results, History history);
    ~TerminalUi();

    TerminalUi(const TerminalUi&) = delete;
    TerminalUi& operator=(const TerminalUi&) = delete;

    // Returns the selected command, or nullopt when cancelled.
    std::optional<std::string> run(const std::optional<std::string>& initial_term);

    void cleanup();
    bool active() const { return active_; }


private:
    Terminal& terminal_;
    History history_;
    SearchSession session_;
    Renderer renderer_;
    bool active_ = false;
};

// Convenience used by main: real terminal, UI run, guaranteed restore.
std::optional<std::string> run_search_ui(History history, size_t num_results,
                                         const std::optional<std::string>& initial_term);
