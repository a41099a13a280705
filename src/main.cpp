#include "cli.h"
#include "libgit2_util.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  pakt::tui::init();

  auto args{ pakt::cli_parse(argc, argv) };
  pakt::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  pakt::libgit2_scope git_guard;

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      pakt::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    pakt::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([&](auto const &cfg) { return pakt::cmd::create(cfg, args.globals); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    pakt::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
