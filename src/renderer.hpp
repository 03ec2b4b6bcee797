#pragma once
#include "session.hpp"
#include "terminal.hpp"

// Draws the input line on row 0 and one match per row below it.
// A frame is queued on the terminal and flushed once.
class Renderer {
public:
    explicit Renderer(Terminal& terminal) : terminal_(terminal) {}

    void drawMatches(const SearchSession& session);

private:
    void queueInputBuffer(const std::string& input, int width);
    void queueMatch(const std::string& command, const std::optional<std::string>& query,
                    bool selected);

    Terminal& terminal_;
};
