#include "platform.h"

#include <cstdio>
#include <cstdlib>

#include <sys/ioctl.h>
#include <unistd.h>

namespace pakt::platform {
namespace {

std::optional<std::filesystem::path> xdg_root(char const *override_var,
                                              char const *xdg_var,
                                              std::filesystem::path const &home_suffix) {
  if (char const *env_root{ std::getenv(override_var) }; env_root && *env_root) {
    return std::filesystem::path{ env_root };
  }

  if (char const *xdg{ std::getenv(xdg_var) }; xdg && *xdg) {
    return std::filesystem::path{ xdg } / "pakt";
  }

  if (char const *home{ std::getenv("HOME") }; home && *home) {
    return std::filesystem::path{ home } / home_suffix / "pakt";
  }

  return std::nullopt;
}

}  // namespace

std::optional<std::filesystem::path> get_default_config_root() {
  return xdg_root("PAKT_CONFIG_HOME", "XDG_CONFIG_HOME", ".config");
}

std::optional<std::filesystem::path> get_default_data_root() {
  return xdg_root("PAKT_DATA_HOME", "XDG_DATA_HOME", std::filesystem::path{ ".local" } / "share");
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

bool is_stdin_tty() { return ::isatty(::fileno(stdin)) != 0; }

int terminal_width() {
  winsize ws{};
  if (::ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) { return ws.ws_col; }
  return 0;
}

}  // namespace pakt::platform
