#pragma once

#include "cmd.h"
#include "cmds/cmd_check.h"
#include "cmds/cmd_install.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_update.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace pakt {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_check::cfg,
                                 cmd_install::cfg,
                                 cmd_list::cfg,
                                 cmd_update::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  cli_globals globals;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace pakt
