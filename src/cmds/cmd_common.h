#pragma once

#include "cmd.h"
#include "git_installer.h"
#include "lua_config.h"
#include "session.h"
#include "update_checker.h"

#include <filesystem>
#include <optional>

namespace pakt {

std::filesystem::path resolve_config_root(std::optional<std::filesystem::path> const &cli_root);
std::filesystem::path resolve_data_root(std::optional<std::filesystem::path> const &cli_root);

// Lua state, session and installer for one command run. Member order matters: the
// session holds Lua functions and must be destroyed before the Lua state.
struct cmd_context : unmovable {
  explicit cmd_context(cli_globals const &globals);

  // Run init.lua, then apply command-line overrides.
  void load();

  lua_config lua;
  session sess;
  git_installer installer;

 private:
  std::optional<std::size_t> jobs_;
};

// Progress line for update checks ("fetch 3/7 [===>   ] owner/repo"); callers
// clear it with tui::progress_clear() once the check completes.
void print_update_progress(update_progress const &progress);

}  // namespace pakt
