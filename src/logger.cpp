#include "logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

spdlog::level::level_enum parse_log_level(const std::optional<std::string>& value) {
    if (!value) return spdlog::level::info;

    std::string level = *value;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (level == "TRACE") return spdlog::level::trace;
    if (level == "DEBUG") return spdlog::level::debug;
    if (level == "WARN") return spdlog::level::warn;
    if (level == "ERROR") return spdlog::level::err;
    return spdlog::level::info;
}

void setup_logging() {
    std::optional<std::string> level_env;
    if (const char* v = std::getenv("TERMSEARCH_LOG")) level_env = v;

    std::shared_ptr<spdlog::logger> logger;
    const char* home = std::getenv("HOME");
    if (home) {
        try {
            std::string path = (fs::path(home) / "termsearch.log").string();
            logger = spdlog::basic_logger_mt("termsearch", path);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Log Error: " << e.what() << std::endl;
        }
    }
    // The UI owns the terminal, so without a file there is nowhere to log
    if (!logger) logger = spdlog::null_logger_mt("termsearch");

    logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
    logger->set_level(parse_log_level(level_env));
    spdlog::set_default_logger(logger);
}
