#pragma once
#include "terminal.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <deque>
#include <memory>
#include <vector>

// Terminal backed by an ftxui fullscreen ScreenInteractive.
// Draw calls fill a back buffer of styled rows; flush() publishes it and lets
// ftxui repaint the alternate screen.
class FtxuiTerminal : public Terminal {
public:
    FtxuiTerminal();
    ~FtxuiTerminal() override;

    void enterInteractive() override;
    void leaveInteractive() override;

    ftxui::Event nextEvent() override;
    TerminalSize size() override;

    void moveTo(int col, int row) override;
    void clearLine() override;
    void setForeground(ftxui::Color color) override;
    void setBackground(ftxui::Color color) override;
    void print(const std::string& text) override;
    void resetColor() override;
    void flush() override;

protected:
    struct Span {
        std::string text;
        ftxui::Color fg;
        ftxui::Color bg;
    };
    using Row = std::vector<Span>;

    Row& currentRow();
    ftxui::Element renderFrame() const;

    std::vector<Row> back_;
    std::vector<Row> front_;

private:
    ftxui::ScreenInteractive screen_;
    ftxui::Component component_;
    std::unique_ptr<ftxui::Loop> loop_;
    std::deque<ftxui::Event> pending_;

    int cursor_col_ = 0;
    int cursor_row_ = 0;
    ftxui::Color fg_ = ftxui::Color::Default;
    ftxui::Color bg_ = ftxui::Color::Default;
};
