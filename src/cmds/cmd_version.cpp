#include "cmd_version.h"

#include "libgit2_util.h"
#include "tui.h"

#include <CLI/CLI.hpp>
#include <sol/sol.hpp>
#include <tbb/version.h>

#ifndef PAKT_VERSION_STR
#error "PAKT_VERSION_STR must be defined by the build system"
#endif

namespace pakt {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cfg cfg, cli_globals const &) : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("pakt version %s", PAKT_VERSION_STR);
  tui::info("");
  tui::info("Third-party components:");
  tui::info("  libgit2: %s", libgit2_version().c_str());
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %d.%d", TBB_VERSION_MAJOR, TBB_VERSION_MINOR);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace pakt
