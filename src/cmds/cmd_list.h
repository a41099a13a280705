#pragma once

#include "cmd.h"

#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace pakt {

class cmd_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_list> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_list(cfg cfg, cli_globals const &globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_globals globals_;
};

}  // namespace pakt
