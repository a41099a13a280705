#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace pakt {

// Options shared by every subcommand.
struct cli_globals {
  std::optional<std::filesystem::path> config_root;
  std::optional<std::filesystem::path> data_root;
  std::optional<std::size_t> jobs;
};

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual bool execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, cli_globals const &globals);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, cli_globals const &globals) {
  return std::make_unique<typename config::cmd_t>(cfg, globals);
}

}  // namespace pakt
