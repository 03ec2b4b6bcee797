#include "ftxui_terminal.hpp"
#include <ftxui/screen/terminal.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iostream>
#include <unistd.h>

FtxuiTerminal::FtxuiTerminal() : screen_(ftxui::ScreenInteractive::Fullscreen()) {
    component_ = ftxui::Renderer([this] { return renderFrame(); });

    // Queue key presses for nextEvent(); our own repaint requests pass through
    component_ |= ftxui::CatchEvent([this](ftxui::Event event) {
        if (event == ftxui::Event::Custom || event.is_mouse()) return false;
        pending_.push_back(event);
        return true;
    });
}

FtxuiTerminal::~FtxuiTerminal() {
    leaveInteractive();
}

void FtxuiTerminal::enterInteractive() {
    if (loop_) return;

    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        throw TerminalError("Failed to enable raw mode: not attached to a terminal");
    }

    // Ctrl+C is a key like any other here
    screen_.ForceHandleCtrlC(false);

    // Loop installs raw mode, the alternate screen and hides the cursor
    loop_ = std::make_unique<ftxui::Loop>(&screen_, component_);
    spdlog::debug("Entered alternate screen");
}

void FtxuiTerminal::leaveInteractive() {
    if (!loop_) return;
    loop_.reset();
    pending_.clear();
    spdlog::debug("Left alternate screen");
}

ftxui::Event FtxuiTerminal::nextEvent() {
    if (!loop_) throw TerminalError("Terminal is not in interactive mode");

    while (pending_.empty()) {
        // Input source is gone, report it as end-of-input
        if (loop_->HasQuitted()) return ftxui::Event::Special({4});
        loop_->RunOnceBlocking();
    }

    ftxui::Event event = pending_.front();
    pending_.pop_front();
    return event;
}

TerminalSize FtxuiTerminal::size() {
    ftxui::Dimensions dim = ftxui::Terminal::Size();
    return {dim.dimx, dim.dimy};
}

FtxuiTerminal::Row& FtxuiTerminal::currentRow() {
    if (cursor_row_ >= static_cast<int>(back_.size())) back_.resize(cursor_row_ + 1);
    return back_[cursor_row_];
}

void FtxuiTerminal::moveTo(int col, int row) {
    cursor_col_ = std::max(col, 0);
    cursor_row_ = std::max(row, 0);
}

void FtxuiTerminal::clearLine() {
    currentRow().clear();
}

void FtxuiTerminal::setForeground(ftxui::Color color) {
    fg_ = color;
}

void FtxuiTerminal::setBackground(ftxui::Color color) {
    bg_ = color;
}

void FtxuiTerminal::resetColor() {
    fg_ = ftxui::Color::Default;
    bg_ = ftxui::Color::Default;
}

void FtxuiTerminal::print(const std::string& text) {
    Row& row = currentRow();

    size_t used = 0;
    for (const auto& span : row) used += span.text.size();
    if (static_cast<size_t>(cursor_col_) > used) {
        row.push_back({std::string(cursor_col_ - used, ' '), ftxui::Color::Default,
                       ftxui::Color::Default});
    }

    row.push_back({text, fg_, bg_});
    cursor_col_ = static_cast<int>(std::max(used, static_cast<size_t>(cursor_col_)) + text.size());
}

void FtxuiTerminal::flush() {
    // Rows past the bottom of the screen are never shown
    int height = size().height;
    if (static_cast<int>(back_.size()) > height) back_.resize(std::max(height, 0));

    front_ = back_;
    if (!loop_) return;

    screen_.PostEvent(ftxui::Event::Custom);
    loop_->RunOnce();

    if (!std::cout) throw TerminalError("Failed to draw to terminal");
}

ftxui::Element FtxuiTerminal::renderFrame() const {
    ftxui::Elements lines;
    for (const auto& row : front_) {
        if (row.empty()) {
            lines.push_back(ftxui::text(""));
            continue;
        }
        ftxui::Elements spans;
        for (const auto& span : row) {
            spans.push_back(ftxui::text(span.text) | ftxui::color(span.fg) | ftxui::bgcolor(span.bg));
        }
        lines.push_back(ftxui::hbox(std::move(spans)));
    }
    return ftxui::vbox(std::move(lines));
}
