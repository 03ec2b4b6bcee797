#include "cli.hpp"
#include <fstream>
#include <sstream>

namespace {

size_t parse_count(const std::string& flag, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw CliError("invalid value '" + value + "' for " + flag);
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw CliError("value out of range for " + flag);
    }
}

} // namespace

std::string usage() {
    std::ostringstream out;
    out << "termsearch " << TERMSEARCH_VERSION
        << " - A minimalist and super fast terminal history search tool.\n\n"
        << "Usage:\n"
        << "  termsearch init\n"
        << "  termsearch search [TERM] [-o FILE] [-m|--max-history N] [-r|--max-results N]\n\n"
        << "Options:\n"
        << "  -o FILE               Write the selected command to FILE\n"
        << "  -m, --max-history N   Maximum number of history lines to read (default 10000)\n"
        << "  -r, --max-results N   Maximum number of results to display (default 10)\n"
        << "  -h, --help            Show this help\n"
        << "  -V, --version         Show the version\n";
    return out.str();
}

CliOptions parse_args(int argc, const char* const argv[]) {
    CliOptions opts;
    if (argc < 2) throw CliError("missing command");

    std::string mode = argv[1];

    if (mode == "-h" || mode == "--help" || mode == "help") {
        opts.mode = Mode::HELP;
        return opts;
    }
    if (mode == "-V" || mode == "--version") {
        opts.mode = Mode::VERSION;
        return opts;
    }
    if (mode == "init") {
        if (argc > 2) throw CliError("unexpected argument '" + std::string(argv[2]) + "'");
        opts.mode = Mode::INIT;
        return opts;
    }
    if (mode != "search") throw CliError("unknown command '" + mode + "'");

    opts.mode = Mode::SEARCH;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-o" || arg == "-m" || arg == "--max-history" ||
            arg == "-r" || arg == "--max-results") {
            if (i + 1 >= argc) throw CliError("missing value for " + arg);
            std::string value = argv[++i];

            if (arg == "-o") opts.output_file = value;
            else if (arg == "-m" || arg == "--max-history") opts.max_history = parse_count(arg, value);
            else opts.max_results = parse_count(arg, value);
        }
        else if (arg == "-h" || arg == "--help") {
            opts.mode = Mode::HELP;
            return opts;
        }
        else if (!opts.term) {
            opts.term = arg;
        }
        else {
            throw CliError("unexpected argument '" + arg + "'");
        }
    }
    return opts;
}

void write_selection(const std::string& path, const std::string& command) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file " + path);
    out << "commandline\t" << command << "\n";
    if (!out) throw std::runtime_error("Failed to write output file " + path);
}
