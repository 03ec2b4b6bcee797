#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;

struct CommandEntry {
    std::string command;
    TimePoint timestamp;
};

class HistoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bounded, chronological command log. Oldest entries are evicted first.
class History {
public:
    explicit History(size_t capacity = 10000) : capacity_(capacity) {}

    void append(CommandEntry entry);
    const std::deque<CommandEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    size_t capacity_;
    std::deque<CommandEntry> entries_;
};

// Parses one zsh extended-history line (": <epoch>:<duration>;<command>").
std::optional<CommandEntry> parse_history_line(const std::string& line);

// $HISTFILE if it names a file, else $HOME/.zsh_history.
std::string get_history_path();

History read_zsh_history(const std::string& path, size_t max_entries);
History read_zsh_history(size_t max_entries);
