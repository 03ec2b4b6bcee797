#include "history.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;

void History::append(CommandEntry entry) {
    if (capacity_ == 0) return;
    if (entries_.size() >= capacity_) entries_.pop_front();
    entries_.push_back(std::move(entry));
}

std::optional<CommandEntry> parse_history_line(const std::string& line) {
    static const std::regex pattern(R"(^: (\d+):\d+;(.*)$)");

    std::smatch caps;
    if (!std::regex_match(line, caps, pattern)) return std::nullopt;

    long long epoch = 0;
    try {
        epoch = std::stoll(caps[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    // TimePoint counts in system_clock ticks; larger epochs do not fit
    constexpr long long max_epoch =
        std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::max()).count();
    if (epoch > max_epoch) {
        spdlog::debug("Timestamp {} is out of range", epoch);
        return std::nullopt;
    }

    std::string command = caps[2].str();
    size_t end = command.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return std::nullopt;
    command.erase(end + 1);

    return CommandEntry{command, TimePoint(std::chrono::seconds(epoch))};
}

std::string get_history_path() {
    const char* histfile = std::getenv("HISTFILE");
    if (histfile && fs::is_regular_file(histfile)) {
        spdlog::debug("Use HISTFILE environment variable: {}", histfile);
        return histfile;
    }

    const char* home = std::getenv("HOME");
    if (!home) throw HistoryError("HOME environment variable not set");

    fs::path fallback = fs::path(home) / ".zsh_history";
    if (!fs::is_regular_file(fallback)) {
        throw HistoryError("ZSH history file not found at default location: " + fallback.string());
    }
    spdlog::debug("Use default ZSH history file path: {}", fallback.string());
    return fallback.string();
}

History read_zsh_history(const std::string& path, size_t max_entries) {
    std::ifstream in(path);
    if (!in) throw HistoryError("Failed to open history file: " + path);

    History history(max_entries);
    std::string line;
    size_t line_num = 0;
    while (std::getline(in, line)) {
        ++line_num;
        auto entry = parse_history_line(line);
        if (!entry) {
            spdlog::debug("Line {} does not match expected format", line_num);
            continue;
        }
        history.append(std::move(*entry));
    }

    spdlog::debug("Read {} history entries", history.size());
    return history;
}

History read_zsh_history(size_t max_entries) {
    return read_zsh_history(get_history_path(), max_entries);
}
