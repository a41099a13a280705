#pragma once

#include "config.h"
#include "event_bus.h"
#include "setup_registry.h"
#include "util.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace pakt {

// Activates registered setups in dependency order. Actions without trigger events run
// immediately; the rest wait on the event bus and run once, after a debounce.
class setup_scheduler : unmovable {
 public:
  setup_scheduler(setup_registry const &registry,
                  activation_table &table,
                  event_bus &bus,
                  session_cfg const &cfg);
  ~setup_scheduler();

  // Returns false if the identity or anything it depends on failed. A waiting
  // (event-gated) identity counts as success.
  bool activate(std::string const &identity);

  // Activate every registered identity in registration order. Returns failed roots.
  std::size_t run_all();

  std::size_t waiting_count() const { return waiting_.size(); }

 private:
  using path_t = std::unordered_set<std::string>;

  bool activate(std::string const &identity, path_t &active_path);
  bool run_action(std::string const &identity, setup_descriptor const &desc);
  void on_event(std::string const &identity, event_args const &args);
  void fire_deferred(std::string const &identity);

  struct waiter {
    event_bus::listener_id listener;
    bool scheduled{ false };
  };

  setup_registry const &registry_;
  activation_table &table_;
  event_bus &bus_;
  session_cfg const &cfg_;
  std::unordered_map<std::string, waiter> waiting_;
};

}  // namespace pakt
