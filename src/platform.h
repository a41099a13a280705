#pragma once

#include <filesystem>
#include <optional>

namespace pakt::platform {

// PAKT_CONFIG_HOME, then $XDG_CONFIG_HOME/pakt, then ~/.config/pakt
std::optional<std::filesystem::path> get_default_config_root();

// PAKT_DATA_HOME, then $XDG_DATA_HOME/pakt, then ~/.local/share/pakt
std::optional<std::filesystem::path> get_default_data_root();

bool is_tty();
bool is_stdin_tty();

// Columns of the terminal behind stderr, 0 when unknown.
int terminal_width();

}  // namespace pakt::platform
