#pragma once

#include "cmd.h"

#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace pakt {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_version(cfg cfg, cli_globals const &globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace pakt
