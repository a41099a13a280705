#pragma once

#include "config.h"
#include "plugin_source.h"
#include "sol_util.h"
#include "util.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace pakt {

class session;

// Convert a Lua value passed to pakt.src (or found in deps / a group) into a source.
// nil becomes an empty group.
// Throws std::runtime_error describing the first malformed field.
plugin_source lua_to_plugin_source(sol::object const &value, std::string_view context);

// Apply a pakt.configure{} table. Throws std::runtime_error on a bad field.
void lua_apply_config(session_cfg &cfg, sol::table const &table);

// Lua state hosting the `pakt` API. Must outlive the session it is bound to, since
// registered setup actions reference Lua functions.
class lua_config : unmovable {
 public:
  explicit lua_config(std::filesystem::path config_root);

  void bind(session &s);

  // Run <config_root>/init.lua. Throws std::runtime_error if missing or failing.
  void load();

  // Run an inline chunk. Throws std::runtime_error on Lua errors.
  void run(std::string_view script, std::string const &chunk_name = "=pakt");

  // pakt.require: register modules under <config_root>/lua/<dotted path>.
  // Returns number of modules registered; failures are reported.
  std::size_t require_modules(std::string_view dotted_path);

  std::filesystem::path const &config_root() const { return config_root_; }
  std::filesystem::path init_file() const { return config_root_ / "init.lua"; }
  sol::state &state() { return *lua_; }

 private:
  bool register_module(std::filesystem::path const &file);
  session &bound_session();

  std::filesystem::path config_root_;
  sol_state_ptr lua_;
  session *session_{ nullptr };
};

}  // namespace pakt
