#include "cmd_check.h"

#include "cmd_common.h"
#include "git_repo_probe.h"
#include "tui.h"

#include <CLI/CLI.hpp>

namespace pakt {

void cmd_check::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("check", "Report plugins whose remote has moved") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_check::cmd_check(cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

bool cmd_check::execute() {
  cmd_context ctx{ globals_ };
  ctx.load();

  git_repo_probe probe;
  auto const result{ ctx.sess.check_updates(ctx.installer, probe, print_update_progress) };
  tui::progress_clear();

  if (result.updates.empty()) {
    tui::info("All plugins are up to date");
  } else {
    for (auto const &r : result.updates) {
      tui::print_stdout("%-40s %s -> %s  (%s)\n",
                        r.identity.c_str(),
                        r.local_revision.c_str(),
                        r.remote_revision.c_str(),
                        r.remote_ref.c_str());
    }
  }

  for (auto const &f : result.failures) {
    tui::warn("%s: %s failed: %s",
              f.identity.c_str(),
              update_phase_name(f.phase),
              f.message.c_str());
  }

  return true;
}

}  // namespace pakt
