#pragma once

#include "plugin_source.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pakt {

// Unregistered -> Registered -> (Waiting | Activating) -> Completed
enum class setup_state { UNREGISTERED, REGISTERED, WAITING, ACTIVATING, COMPLETED };

char const *setup_state_name(setup_state state);

struct setup_descriptor {
  setup_action_t action;                   // empty: no setup needed
  std::vector<std::string> dependencies;   // identities activated first, in order
  std::optional<std::vector<std::string>> trigger_events;  // nullopt: run after install
};

struct plugin_state {
  bool installed{ false };
  setup_state state{ setup_state::UNREGISTERED };
};

// Setup descriptors keyed by identity, iterated in registration order.
class setup_registry {
 public:
  // Returns false (and leaves the existing entry alone) if identity is already present.
  bool add(std::string const &identity, setup_descriptor desc);

  setup_descriptor const *find(std::string_view identity) const;
  std::vector<std::string> const &identities() const { return order_; }
  std::size_t size() const { return order_.size(); }

 private:
  std::unordered_map<std::string, setup_descriptor> descriptors_;
  std::vector<std::string> order_;
};

// Per-identity install/activation state. `COMPLETED` is absorbing.
class activation_table {
 public:
  void mark_installed(std::string const &identity);
  void mark_registered(std::string const &identity);
  void set_state(std::string const &identity, setup_state state);

  bool is_installed(std::string_view identity) const;
  setup_state state(std::string_view identity) const;
  bool is_completed(std::string_view identity) const {
    return state(identity) == setup_state::COMPLETED;
  }

 private:
  plugin_state const *find(std::string_view identity) const;

  std::unordered_map<std::string, plugin_state> states_;
};

}  // namespace pakt
