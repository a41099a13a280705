#include "cmd_list.h"

#include "cmd_common.h"
#include "tui.h"

#include <CLI/CLI.hpp>

namespace pakt {

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "List installed plugins") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_list::cmd_list(cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

bool cmd_list::execute() {
  git_installer installer{ resolve_data_root(globals_.data_root) / "plugins" };

  for (auto const &pkg : installer.list_installed()) {
    tui::print_stdout("%-40s %s  %s\n",
                      pkg.identity.c_str(),
                      pkg.path.string().c_str(),
                      pkg.source.c_str());
  }
  return true;
}

}  // namespace pakt
