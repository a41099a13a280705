#pragma once

#include "plugin_source.h"
#include "setup_registry.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pakt {

struct planned_setup {
  std::string identity;
  setup_descriptor desc;
};

struct install_plan {
  std::vector<plugin_descriptor> plugins;  // deps before dependents, first occurrence wins
  std::vector<planned_setup> setups;       // registration order
  std::size_t skipped{ 0 };                // top-level entries rejected as malformed
};

// Expand every registered source into the flat installation set and the setup
// descriptors it declares. A malformed top-level entry is reported and skipped as a
// whole; the remaining entries are still planned.
install_plan build_install_plan(std::vector<plugin_source> const &sources,
                                std::string_view default_host);

}  // namespace pakt
