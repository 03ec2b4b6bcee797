#include "init.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

const char* const ZSH_WIDGET_SCRIPT = R"ZSH(#!/bin/zsh

# Check if the script is being run by ZSH
if [[ ! "$ZSH_VERSION" ]]; then
    echo "Error: This script must be run by ZSH."
    return 1
fi

termsearch-search() {
    local temp_file=$(mktemp -t termsearch.XXXXXX)

    termsearch search -o "$temp_file" "$LBUFFER"

    local commandline
    while IFS=$'\t' read -r key val; do
        case "$key" in
            commandline) commandline="$val" ;;
        esac
    done < "$temp_file"

    command rm -f "$temp_file"

    if [[ -n "$commandline" ]]; then
        LBUFFER="$commandline"
        CURSOR=$#LBUFFER
        zle redisplay
    fi
}

zle -N termsearch-search
bindkey '^R' termsearch-search
)ZSH";

std::string get_zsh_config_dir() {
    if (const char* zdotdir = std::getenv("ZDOTDIR")) return zdotdir;
    if (const char* home = std::getenv("HOME")) return home;
    throw std::runtime_error("HOME environment variable not set");
}

bool append_line_once(const std::string& file_path, const std::string& content) {
    spdlog::debug("Append content to file: {}", file_path);

    if (fs::exists(file_path)) {
        std::ifstream in(file_path);
        std::stringstream existing;
        existing << in.rdbuf();
        if (existing.str().find(content) != std::string::npos) {
            spdlog::debug("Content already present in file");
            return false;
        }
    }

    std::ofstream out(file_path, std::ios::app);
    if (!out) throw std::runtime_error("Failed to open or create " + file_path);
    out << content << '\n';
    if (!out) throw std::runtime_error("Failed to write to " + file_path);
    return true;
}

void install_zsh_widget(const std::string& config_dir) {
    fs::path script_path = fs::path(config_dir) / "termsearch.zsh";
    spdlog::debug("File path to termsearch.zsh: {}", script_path.string());

    {
        std::ofstream out(script_path, std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to write to " + script_path.string());
        out << ZSH_WIDGET_SCRIPT;
    }

    fs::path zshrc = fs::path(config_dir) / ".zshrc";
    append_line_once(zshrc.string(), "source " + script_path.string());
}

void handle_init() {
    std::string config_dir = get_zsh_config_dir();
    spdlog::debug("ZSH configuration directory: {}", config_dir);

    install_zsh_widget(config_dir);
    std::cout << "Successfully initialized termsearch. Restart your terminal to enable it." << std::endl;
}
