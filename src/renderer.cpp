#include "renderer.hpp"
#include <spdlog/spdlog.h>

using ftxui::Color;

namespace {

const std::string PROMPT = "> ";

Color foreground_for(bool selected) { return selected ? Color(Color::Black) : Color(Color::Default); }
Color background_for(bool selected) { return selected ? Color(Color::White) : Color(Color::Default); }

} // namespace

void Renderer::queueInputBuffer(const std::string& input, int width) {
    std::string line = PROMPT + input;
    if (static_cast<int>(line.size()) < width) line.append(width - line.size(), ' ');

    terminal_.moveTo(0, 0);
    terminal_.clearLine();
    terminal_.print(line);
}

void Renderer::queueMatch(const std::string& command, const std::optional<std::string>& query,
                          bool selected) {
    // Only rows with a locatable query get the before/match/after split
    size_t start = std::string::npos;
    if (query && !query->empty()) start = to_lower(command).find(to_lower(*query));

    if (start == std::string::npos) {
        terminal_.print(command);
        return;
    }

    size_t end = start + query->size();
    terminal_.print(command.substr(0, start));
    terminal_.setForeground(Color::Yellow);
    terminal_.print(command.substr(start, end - start));
    terminal_.setForeground(foreground_for(selected));
    terminal_.print(command.substr(end));
}

void Renderer::drawMatches(const SearchSession& session) {
    spdlog::debug("Draw matches");
    TerminalSize size = terminal_.size();

    // 1. Clear every row below the input line
    for (int row = 1; row < size.height; row++) {
        terminal_.moveTo(0, row);
        terminal_.clearLine();
    }

    // 2. One row per match, selected row inverted
    const RankedList& matches = session.matches();
    for (size_t i = 0; i < matches.size(); i++) {
        if (static_cast<int>(i) + 1 >= size.height) break;
        bool selected = (i == session.selectedIndex());

        terminal_.moveTo(0, static_cast<int>(i) + 1);
        terminal_.setForeground(foreground_for(selected));
        terminal_.setBackground(background_for(selected));
        queueMatch(matches[i].command, session.query(), selected);
        terminal_.resetColor();
    }

    // 3. Input line last, then a single flush for the whole frame
    queueInputBuffer(session.input(), size.width);
    terminal_.flush();
}
