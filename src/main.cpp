#include "cli.hpp"
#include "history.hpp"
#include "init.hpp"
#include "logger.hpp"
#include "tui.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <optional>
#include <utility>

int handle_search(const CliOptions& opts) {
    // 1. Load history
    History history = read_zsh_history(opts.max_history);

    // 2. Run the UI; the terminal is restored before we touch stdout again
    std::optional<std::string> selection = run_search_ui(std::move(history), opts.max_results, opts.term);

    if (!selection) {
        spdlog::debug("No command selected");
        return 0;
    }

    // 3. Hand the selection back to the shell
    spdlog::debug("Selected command: {}", *selection);
    if (opts.output_file) {
        write_selection(*opts.output_file, *selection);
    } else {
        std::cout << *selection << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    setup_logging();
    spdlog::debug("Start termsearch v{}", TERMSEARCH_VERSION);

    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const CliError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage();
        return 2;
    }

    try {
        switch (opts.mode) {
            case Mode::HELP:
                std::cout << usage();
                return 0;
            case Mode::VERSION:
                std::cout << "termsearch " << TERMSEARCH_VERSION << std::endl;
                return 0;
            case Mode::INIT:
                handle_init();
                return 0;
            case Mode::SEARCH:
                return handle_search(opts);
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
