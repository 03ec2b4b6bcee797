#include "session.hpp"
#include <spdlog/spdlog.h>
#include <utility>

using ftxui::Event;

SearchSession::SearchSession(const History& history, size_t limit, Clock clock)
    : history_(history), limit_(limit), clock_(std::move(clock)) {}

void SearchSession::start(const std::optional<std::string>& initial_query) {
    input_.clear();
    query_.reset();
    if (initial_query) {
        input_ = *initial_query;
        query_ = input_;
    }
    updateMatches();
}

void SearchSession::setInput(std::string input) {
    input_ = std::move(input);
    query_ = input_;
    updateMatches();
}

void SearchSession::updateMatches() {
    spdlog::debug("Update matches");
    TimePoint now = clock_();
    if (query_ && !query_->empty()) {
        matches_ = search_commands(*query_, history_, limit_, now);
    } else {
        matches_ = most_frequent(history_, limit_, now);
    }
    selected_index_ = 0;
}

void SearchSession::selectNext() {
    if (selected_index_ + 1 >= matches_.size()) {
        selected_index_ = 0;
    } else {
        selected_index_++;
    }
}

void SearchSession::selectPrevious() {
    if (selected_index_ == 0) {
        selected_index_ = matches_.empty() ? 0 : matches_.size() - 1;
    } else {
        selected_index_--;
    }
}

KeyAction SearchSession::handleEvent(const Event& event) {
    // --- Exit keys ---
    if (event == Event::Escape) {
        spdlog::debug("Escape key pressed");
        return KeyAction::EXIT;
    }
    if (event == Event::Special({3})) {
        spdlog::debug("Ctrl+C pressed");
        return KeyAction::EXIT;
    }
    if (event == Event::Special({4})) {
        spdlog::debug("Ctrl+D pressed");
        return KeyAction::EXIT;
    }

    // --- Navigation ---
    if (event == Event::ArrowDown || event == Event::Tab) {
        spdlog::debug("Down/Tab key pressed");
        selectNext();
        return KeyAction::REDRAW;
    }
    if (event == Event::ArrowUp || event == Event::TabReverse) {
        spdlog::debug("Up/Shift+Tab key pressed");
        selectPrevious();
        return KeyAction::REDRAW;
    }

    // --- Selection ---
    if (event == Event::Return) {
        spdlog::debug("Enter key pressed");
        if (matches_.empty()) return KeyAction::CONTINUE;
        selection_ = matches_[selected_index_].command;
        return KeyAction::SELECT;
    }

    // --- Editing ---
    if (event == Event::Backspace) {
        spdlog::debug("Backspace pressed");
        std::string input = input_;
        // Drop a whole UTF-8 sequence: continuation bytes, then the lead byte
        while (!input.empty() && (static_cast<unsigned char>(input.back()) & 0xC0) == 0x80) {
            input.pop_back();
        }
        if (!input.empty()) input.pop_back();
        setInput(std::move(input));
        return KeyAction::REDRAW;
    }
    if (event.is_character()) {
        const std::string& ch = event.character();
        // Control bytes are not text
        if (ch.size() == 1 && static_cast<unsigned char>(ch[0]) < 0x20) {
            return KeyAction::CONTINUE;
        }
        spdlog::debug("Character '{}' pressed", ch);
        setInput(input_ + ch);
        return KeyAction::REDRAW;
    }

    spdlog::debug("Other key pressed");
    return KeyAction::CONTINUE;
}
