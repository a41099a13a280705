#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pakt {

// Passthrough values forwarded to the installer untouched.
using option_value = std::variant<bool, std::int64_t, double, std::string>;
using option_map = std::map<std::string, option_value>;

using setup_action_t = std::function<void()>;

struct plugin_source;

// Bare string: a URL or "owner/repo" shorthand.
struct source_identifier {
  std::string value;
};

// Table carrying a `src` field.
struct single_plugin {
  std::string src;
  std::optional<std::string> version;  // branch, tag, or commit to track
  option_map options;

  // Lifecycle fields, interpreted by the install plan and never passed through
  setup_action_t setup;
  std::vector<plugin_source> deps;
  std::optional<std::vector<std::string>> events;
};

// Table without `src`: an ordered list of nested sources.
struct source_group {
  std::vector<plugin_source> entries;
};

struct plugin_source {
  using variant_t = std::variant<source_identifier, single_plugin, source_group>;

  plugin_source(source_identifier id) : v{ std::move(id) } {}
  plugin_source(single_plugin plugin) : v{ std::move(plugin) } {}
  plugin_source(source_group group) : v{ std::move(group) } {}
  plugin_source(std::string identifier) : v{ source_identifier{ std::move(identifier) } } {}
  plugin_source(char const *identifier) : v{ source_identifier{ identifier } } {}

  variant_t v;
};

// Canonical, flattened unit handed to the installer.
struct plugin_descriptor {
  std::string source;  // absolute fetch URL
  std::optional<std::string> branch_override;
  option_map options;

  bool operator==(plugin_descriptor const &) const = default;
};

// Render an option for logs: strings quoted, numbers and booleans bare.
std::string option_value_to_string(option_value const &value);

}  // namespace pakt
