#include "cmd_install.h"

#include "cmd_common.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace pakt {

void cmd_install::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("install", "Install configured plugins and run their setups") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_install::cmd_install(cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

bool cmd_install::execute() {
  cmd_context ctx{ globals_ };
  ctx.load();

  auto const summary{ ctx.sess.install(ctx.installer) };

  auto &bus{ ctx.sess.events() };
  bus.emit(ctx.sess.cfg().enter_event);
  bus.drain();

  if (summary.skipped) { tui::warn("%zu plugin entries skipped", summary.skipped); }
  if (summary.setup_failures) { tui::warn("%zu setups failed", summary.setup_failures); }

  return summary.installed == summary.planned && summary.setup_failures == 0;
}

}  // namespace pakt
