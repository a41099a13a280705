#include "cli.h"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace pakt {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "pakt - plugin manager" };

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  std::string config_root;
  app.add_option("--config", config_root, "Config root containing init.lua");

  std::string data_root;
  app.add_option("--data", data_root, "Data root; plugins are installed under <data>/plugins");

  std::size_t jobs{ 0 };
  auto *jobs_option{ app.add_option("-j,--jobs", jobs, "Concurrent remote checks")
                         ->check(CLI::PositiveNumber) };

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto c) { cmd_cfg = std::move(c); } };

  cmd_install::register_cli(app, on_selected);
  cmd_check::register_cli(app, on_selected);
  cmd_update::register_cli(app, on_selected);
  cmd_list::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (!config_root.empty()) { args.globals.config_root = std::filesystem::path{ config_root }; }
  if (!data_root.empty()) { args.globals.data_root = std::filesystem::path{ data_root }; }
  if (jobs_option->count() > 0) { args.globals.jobs = jobs; }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace pakt
