#pragma once
#include "history.hpp"
#include "search.hpp"
#include <ftxui/component/event.hpp>
#include <functional>
#include <optional>
#include <string>

enum class KeyAction { CONTINUE, REDRAW, SELECT, EXIT };

// Input buffer, ranked matches and selection cursor for one search run.
// Any step that replaces the matches also resets the selection to 0.
class SearchSession {
public:
    using Clock = std::function<TimePoint()>;

    SearchSession(const History& history, size_t limit,
                  Clock clock = [] { return std::chrono::system_clock::now(); });

    // Seeds the input buffer and ranks once.
    void start(const std::optional<std::string>& initial_query);

    KeyAction handleEvent(const ftxui::Event& event);

    const std::string& input() const { return input_; }
    const std::optional<std::string>& query() const { return query_; }
    const RankedList& matches() const { return matches_; }
    size_t selectedIndex() const { return selected_index_; }

    // Valid after handleEvent() returned SELECT.
    const std::string& selection() const { return selection_; }

    void selectNext();
    void selectPrevious();

private:
    void setInput(std::string input);
    void updateMatches();

    const History& history_;
    size_t limit_;
    Clock clock_;

    std::string input_;
    std::optional<std::string> query_;
    RankedList matches_;
    size_t selected_index_ = 0;
    std::string selection_;
};
