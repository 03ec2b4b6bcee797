#pragma once
#include <ftxui/component/event.hpp>
#include <ftxui/screen/color.hpp>
#include <stdexcept>
#include <string>

class TerminalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TerminalSize {
    int width;
    int height;
};

// Minimal terminal surface used by the renderer and the UI loop.
// Draw calls are queued and only become visible on flush().
class Terminal {
public:
    virtual ~Terminal() = default;

    // Raw mode + alternate screen + hidden cursor. Throws TerminalError.
    virtual void enterInteractive() = 0;
    // Reverse of enterInteractive(). Best-effort.
    virtual void leaveInteractive() = 0;

    // Blocks until the next keyboard event.
    virtual ftxui::Event nextEvent() = 0;
    virtual TerminalSize size() = 0;

    virtual void moveTo(int col, int row) = 0;
    virtual void clearLine() = 0;
    virtual void setForeground(ftxui::Color color) = 0;
    virtual void setBackground(ftxui::Color color) = 0;
    virtual void print(const std::string& text) = 0;
    virtual void resetColor() = 0;
    virtual void flush() = 0;
};
