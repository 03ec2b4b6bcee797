#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

constexpr const char* TERMSEARCH_VERSION = "0.1.0";

enum class Mode { INIT, SEARCH, HELP, VERSION };

struct CliOptions {
    Mode mode = Mode::HELP;
    std::optional<std::string> term;
    std::optional<std::string> output_file;
    size_t max_history = 10000;
    size_t max_results = 10;
};

class CliError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Usage: termsearch search [TERM] [-o FILE] [-m|--max-history N] [-r|--max-results N]
//        termsearch init
CliOptions parse_args(int argc, const char* const argv[]);

std::string usage();

// "commandline\t<cmd>\n", read back by the zsh widget
void write_selection(const std::string& path, const std::string& command);
