#include "cmd_update.h"

#include "cmd_common.h"
#include "git_repo_probe.h"
#include "platform.h"
#include "tui.h"
#include "update_selector.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace pakt {

void cmd_update::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("update", "Update plugins whose remote has moved") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("names", cfg_ptr->names, "Plugin identities to update (owner/repo)");
  sub->add_flag("--all", cfg_ptr->all, "Update every plugin with a pending update");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_update::cmd_update(cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

bool cmd_update::execute() {
  cmd_context ctx{ globals_ };
  ctx.load();

  std::unique_ptr<update_selector> selector;
  if (cfg_.all) {
    selector = std::make_unique<static_selector>(update_selection{ select_all{} });
  } else if (!cfg_.names.empty()) {
    selector = std::make_unique<static_selector>(update_selection{ cfg_.names });
  } else if (platform::is_stdin_tty()) {
    selector = std::make_unique<prompt_selector>();
  } else {
    selector = std::make_unique<static_selector>(std::nullopt);
  }

  git_repo_probe probe;
  auto const updated{ ctx.sess.update(ctx.installer, probe, *selector, print_update_progress) };
  tui::progress_clear();
  for (auto const &id : updated) { tui::info("Updated %s", id.c_str()); }
  return true;
}

}  // namespace pakt
