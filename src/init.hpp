#pragma once
#include <string>

// zsh widget bound to Ctrl+R that runs `termsearch search` on the current buffer
extern const char* const ZSH_WIDGET_SCRIPT;

// $ZDOTDIR, else $HOME. Throws std::runtime_error when neither is set.
std::string get_zsh_config_dir();

// Appends `content` as a line unless the file already contains it.
// Returns false when it was already present.
bool append_line_once(const std::string& file_path, const std::string& content);

// Writes termsearch.zsh into `config_dir` and sources it from .zshrc.
void install_zsh_widget(const std::string& config_dir);

void handle_init();
