#include "lua_config.h"

#include "session.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>

namespace pakt {
namespace {

constexpr std::string_view kLifecycleKeys[]{ "src", "version", "setup", "deps", "event" };

bool is_lifecycle_key(std::string_view key) {
  return std::ranges::find(kLifecycleKeys, key) != std::end(kLifecycleKeys);
}

setup_action_t make_setup_action(sol::protected_function fn) {
  return [fn = std::move(fn)] {
    sol::protected_function_result result{ fn() };
    if (!result.valid()) {
      sol::error err = result;
      throw std::runtime_error(err.what());
    }
  };
}

std::vector<plugin_source> lua_to_deps(sol::object const &deps, std::string const &context) {
  if (deps.is<std::string>()) { return { source_identifier{ deps.as<std::string>() } }; }
  if (deps.get_type() != sol::type::table) {
    throw std::runtime_error(context + ": deps must be a string or a table");
  }

  sol::table const table{ deps.as<sol::table>() };
  if (sol::object const src = table["src"]; src.valid()) {
    return { lua_to_plugin_source(deps, context) };
  }

  std::vector<plugin_source> out;
  for (std::size_t i{ 1 }, n{ table.size() }; i <= n; ++i) {
    sol::object const item = table[i];
    out.push_back(lua_to_plugin_source(item, context + ".deps[" + std::to_string(i) + "]"));
  }
  return out;
}

single_plugin lua_to_single(sol::table const &table, std::string const &context) {
  single_plugin plugin{ .src = sol_util_get_optional<std::string>(table, "src", context)
                                   .value_or(std::string{}) };
  if (plugin.src.empty()) { throw std::runtime_error(context + ": src must be a string"); }

  std::string const ctx{ context + " (" + plugin.src + ")" };
  plugin.version = sol_util_get_optional<std::string>(table, "version", ctx);

  if (auto fn{ sol_util_get_optional<sol::protected_function>(table, "setup", ctx) }) {
    plugin.setup = make_setup_action(std::move(*fn));
  }

  if (sol::object const deps = table["deps"]; deps.valid()) {
    plugin.deps = lua_to_deps(deps, ctx);
  }

  if (sol::object const event = table["event"]; event.valid()) {
    plugin.events = sol_util_string_list(event, ctx + ": event");
  }

  for (auto const &[key, value] : table) {
    if (!key.is<std::string>()) { continue; }
    auto const name{ key.as<std::string>() };
    if (is_lifecycle_key(name)) { continue; }

    if (auto opt{ sol_util_to_option_value(value) }) {
      plugin.options.emplace(name, std::move(*opt));
    } else {
      tui::warn("%s: option '%s' is not a scalar; ignoring", ctx.c_str(), name.c_str());
    }
  }
  return plugin;
}

}  // namespace

plugin_source lua_to_plugin_source(sol::object const &value, std::string_view context) {
  std::string const ctx{ context };

  // nil contributes nothing
  if (!value.valid() || value.get_type() == sol::type::lua_nil) { return source_group{}; }
  if (value.is<std::string>()) { return source_identifier{ value.as<std::string>() }; }
  if (value.get_type() != sol::type::table) {
    throw std::runtime_error(ctx + ": expected a string or a table");
  }

  sol::table const table{ value.as<sol::table>() };
  if (sol::object const src = table["src"]; src.valid()) {
    return lua_to_single(table, ctx);
  }

  if (!sol_util_is_array(table)) {
    throw std::runtime_error(ctx + ": table has no src and is not a list of sources");
  }

  source_group group;
  for (std::size_t i{ 1 }, n{ table.size() }; i <= n; ++i) {
    sol::object const item = table[i];
    group.entries.push_back(lua_to_plugin_source(item, ctx + "[" + std::to_string(i) + "]"));
  }
  return group;
}

void lua_apply_config(session_cfg &cfg, sol::table const &table) {
  constexpr std::string_view ctx{ "pakt.configure" };

  if (auto v{ sol_util_get_optional<std::int64_t>(table, "parallel", ctx) }) {
    if (*v <= 0) { throw std::runtime_error("pakt.configure: parallel must be positive"); }
    cfg.parallel_limit = static_cast<std::size_t>(*v);
  }
  if (auto v{ sol_util_get_optional<std::string>(table, "default_host", ctx) }) {
    if (v->empty()) { throw std::runtime_error("pakt.configure: default_host is empty"); }
    cfg.default_host = std::move(*v);
  }
  if (auto v{ sol_util_get_optional<bool>(table, "clear_queue", ctx) }) {
    cfg.clear_queue_after_install = *v;
  }
  if (auto v{ sol_util_get_optional<std::string>(table, "enter_event", ctx) }) {
    if (v->empty()) { throw std::runtime_error("pakt.configure: enter_event is empty"); }
    cfg.enter_event = std::move(*v);
  }
  if (auto v{ sol_util_get_optional<std::int64_t>(table, "debounce_ms", ctx) }) {
    if (*v < 0) { throw std::runtime_error("pakt.configure: debounce_ms is negative"); }
    cfg.debounce = std::chrono::milliseconds{ *v };
  }
  if (sol::object const branches = table["fallback_branches"]; branches.valid()) {
    cfg.fallback_branches = sol_util_string_list(branches, "pakt.configure: fallback_branches");
  }
}

lua_config::lua_config(std::filesystem::path config_root)
    : config_root_{ std::move(config_root) }, lua_{ sol_util_make_lua_state() } {
  auto const lua_dir{ config_root_ / "lua" };
  std::string const old_path{ (*lua_)["package"]["path"].get_or(std::string{}) };
  (*lua_)["package"]["path"] = (lua_dir / "?.lua").string() + ";" +
                               (lua_dir / "?" / "init.lua").string() + ";" + old_path;
}

session &lua_config::bound_session() {
  if (!session_) { throw std::logic_error("lua_config: no session bound"); }
  return *session_;
}

void lua_config::bind(session &s) {
  session_ = &s;

  sol::table pakt{ lua_->create_named_table("pakt") };

  pakt.set_function("src", [this](sol::object value) {
    if (!value.valid() || value.get_type() == sol::type::lua_nil) { return; }
    try {
      bound_session().add(lua_to_plugin_source(value, "pakt.src"));
    } catch (std::runtime_error const &e) {
      tui::error("%s", e.what());
    }
  });

  pakt.set_function("require", [this](std::string path) { return require_modules(path); });

  pakt.set_function("configure", [this](sol::table tbl) {
    try {
      lua_apply_config(bound_session().cfg(), tbl);
    } catch (std::runtime_error const &e) {
      tui::error("%s", e.what());
    }
  });

  pakt.set_function("emit", [this](std::string event, sol::optional<std::string> subject) {
    return bound_session().events().emit(event, subject.value_or(std::string{}));
  });
}

void lua_config::load() {
  auto const file{ init_file() };
  if (!std::filesystem::exists(file)) {
    throw std::runtime_error("config file not found: " + file.string());
  }
  run(util_load_text_file(file), "@" + file.string());
}

void lua_config::run(std::string_view script, std::string const &chunk_name) {
  sol::protected_function_result result{
    lua_->safe_script(script, sol::script_pass_on_error, chunk_name)
  };
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(err.what());
  }
}

bool lua_config::register_module(std::filesystem::path const &file) {
  sol::protected_function_result result{
    lua_->safe_script_file(file.string(), sol::script_pass_on_error)
  };
  if (!result.valid()) {
    sol::error err = result;
    tui::error("Failed to load module %s: %s", file.string().c_str(), err.what());
    return false;
  }

  sol::object const returned = result;
  if (returned.get_type() != sol::type::table) {
    tui::debug("Module %s returned no plugin table", file.string().c_str());
    return false;
  }

  try {
    bound_session().add(lua_to_plugin_source(returned, file.filename().string()));
  } catch (std::runtime_error const &e) {
    tui::error("%s", e.what());
    return false;
  }
  return true;
}

std::size_t lua_config::require_modules(std::string_view dotted_path) {
  std::string rel{ dotted_path };
  std::ranges::replace(rel, '.', '/');
  auto const base{ config_root_ / "lua" / rel };

  std::error_code ec;
  if (auto file{ base }; std::filesystem::is_regular_file(file.concat(".lua"), ec)) {
    return register_module(file) ? 1 : 0;
  }

  if (!std::filesystem::is_directory(base, ec)) {
    tui::error("pakt.require: module path not found: %s", std::string{ dotted_path }.c_str());
    return 0;
  }

  std::vector<std::filesystem::path> files;
  for (auto it{ std::filesystem::directory_iterator(base, ec) };
       !ec && it != std::filesystem::directory_iterator{};
       it.increment(ec)) {
    if (it->is_regular_file() && it->path().extension() == ".lua") {
      files.push_back(it->path());
    }
  }
  if (ec) {
    tui::error("pakt.require: cannot read %s: %s", base.string().c_str(), ec.message().c_str());
    return 0;
  }

  std::ranges::sort(files);
  std::size_t registered{ 0 };
  for (auto const &f : files) {
    if (register_module(f)) { ++registered; }
  }
  return registered;
}

}  // namespace pakt
