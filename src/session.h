#pragma once

#include "config.h"
#include "event_bus.h"
#include "installer.h"
#include "plugin_source.h"
#include "repo_probe.h"
#include "setup_registry.h"
#include "setup_scheduler.h"
#include "update_checker.h"
#include "update_selector.h"
#include "util.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pakt {

struct install_summary {
  std::size_t planned{ 0 };
  std::size_t installed{ 0 };      // confirmed by the installer
  std::size_t skipped{ 0 };        // malformed entries
  std::size_t setup_failures{ 0 };  // failed scheduler roots
};

// Everything one configuration run accumulates: the registration queue, setup
// registry, activation state and event bus. Not thread-safe.
class session : unmovable {
 public:
  explicit session(session_cfg cfg = {});

  void add(plugin_source source);
  std::vector<plugin_source> const &queued() const { return queue_; }

  install_summary install(installer &inst);

  // Installed packages with the versions of registered sources merged in. Works
  // without a prior install() so check and update honor pinned versions.
  std::vector<installed_package> tracked_packages(installer &inst) const;

  update_check_result check_updates(installer &inst,
                                    repo_probe &probe,
                                    update_progress_cb_t const &on_progress = {});

  // Check, select, dispatch. Returns identities updated.
  std::vector<std::string> update(installer &inst,
                                  repo_probe &probe,
                                  update_selector &selector,
                                  update_progress_cb_t const &on_progress = {});

  session_cfg &cfg() { return cfg_; }
  session_cfg const &cfg() const { return cfg_; }
  event_bus &events() { return bus_; }
  setup_registry const &registry() const { return registry_; }
  activation_table const &activation() const { return table_; }

 private:
  void record_overrides(plugin_source const &source);

  session_cfg cfg_;
  std::vector<plugin_source> queue_;
  std::unordered_map<std::string, std::string> branch_overrides_;
  setup_registry registry_;
  activation_table table_;
  event_bus bus_;
  std::unique_ptr<setup_scheduler> scheduler_;
};

}  // namespace pakt
