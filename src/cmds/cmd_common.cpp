#include "cmd_common.h"

#include "platform.h"
#include "tui.h"

#include <stdexcept>

namespace pakt {

std::filesystem::path resolve_config_root(std::optional<std::filesystem::path> const &cli_root) {
  if (cli_root) { return *cli_root; }
  if (auto root{ platform::get_default_config_root() }) { return *root; }
  throw std::runtime_error("cannot determine config root; set PAKT_CONFIG_HOME or pass --config");
}

std::filesystem::path resolve_data_root(std::optional<std::filesystem::path> const &cli_root) {
  if (cli_root) { return *cli_root; }
  if (auto root{ platform::get_default_data_root() }) { return *root; }
  throw std::runtime_error("cannot determine data root; set PAKT_DATA_HOME or pass --data");
}

cmd_context::cmd_context(cli_globals const &globals)
    : lua{ resolve_config_root(globals.config_root) },
      installer{ resolve_data_root(globals.data_root) / "plugins" },
      jobs_{ globals.jobs } {
  lua.bind(sess);
}

void cmd_context::load() {
  tui::debug("Loading %s", lua.init_file().string().c_str());
  lua.load();

  if (jobs_) { sess.cfg().parallel_limit = *jobs_; }
  session_cfg_validate(sess.cfg());
}

void print_update_progress(update_progress const &progress) {
  tui::debug("%s %zu/%zu %s",
             update_phase_name(progress.phase),
             progress.completed,
             progress.total,
             progress.identity.c_str());
  tui::progress_set({ .label = update_phase_name(progress.phase),
                      .completed = progress.completed,
                      .total = progress.total,
                      .status = progress.identity });
}

}  // namespace pakt
