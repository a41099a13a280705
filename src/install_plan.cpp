#include "install_plan.h"

#include "source_identity.h"
#include "source_normalize.h"
#include "tui.h"
#include "util.h"

#include <stdexcept>
#include <unordered_set>

namespace pakt {
namespace {

using event_list_t = std::optional<std::vector<std::string>>;

struct plan_builder {
  std::string_view default_host;
  install_plan plan;
  std::unordered_set<std::string> seen_plugins;
  std::unordered_set<std::string> seen_setups;

  void add_plugin(plugin_descriptor desc) {
    auto const id{ source_identity(desc) };
    if (!id) { throw std::runtime_error("cannot derive identity from " + desc.source); }
    if (seen_plugins.insert(*id).second) { plan.plugins.push_back(std::move(desc)); }
  }

  std::vector<std::string> identities_of(plugin_source const &dep) const {
    std::vector<std::string> ids;
    for (auto const &desc : normalize_source(dep, default_host)) {
      if (auto id{ source_identity(desc) }) { ids.push_back(std::move(*id)); }
    }
    return ids;
  }

  void walk(plugin_source const &source, event_list_t const &parent_events) {
    std::visit(match{
                   [&](source_identifier const &) {
                     for (auto &desc : normalize_source(source, default_host)) {
                       add_plugin(std::move(desc));
                     }
                   },
                   [&](source_group const &group) {
                     for (auto const &entry : group.entries) { walk(entry, parent_events); }
                   },
                   [&](single_plugin const &plugin) { walk_single(plugin, parent_events); },
               },
               source.v);
  }

  void walk_single(single_plugin const &plugin, event_list_t const &parent_events) {
    auto const effective_events{ plugin.events ? plugin.events : parent_events };

    for (auto const &dep : plugin.deps) { walk(dep, effective_events); }

    auto desc{ normalize_single(plugin, default_host) };
    auto const identity{ source_identity(desc) };
    if (!identity) { throw std::runtime_error("cannot derive identity from " + desc.source); }
    add_plugin(std::move(desc));

    if (!plugin.setup) { return; }

    setup_descriptor setup{ .action = plugin.setup, .trigger_events = effective_events };
    for (auto const &dep : plugin.deps) {
      for (auto &id : identities_of(dep)) { setup.dependencies.push_back(std::move(id)); }
    }

    if (!seen_setups.insert(*identity).second) {
      tui::warn("setup for %s declared more than once; keeping the first",
                identity->c_str());
      return;
    }
    plan.setups.push_back(planned_setup{ .identity = *identity, .desc = std::move(setup) });
  }
};

}  // namespace

install_plan build_install_plan(std::vector<plugin_source> const &sources,
                                std::string_view default_host) {
  plan_builder result{ .default_host = default_host };

  for (auto const &source : sources) {
    plan_builder entry{ .default_host = default_host,
                        .seen_plugins = result.seen_plugins,
                        .seen_setups = result.seen_setups };
    try {
      entry.walk(source, std::nullopt);
    } catch (std::exception const &e) {
      auto const id{ source_identity(source) };
      tui::error("skipping plugin entry %s: %s",
                 id ? id->c_str() : "<unidentified>",
                 e.what());
      ++result.plan.skipped;
      continue;
    }

    for (auto &desc : entry.plan.plugins) { result.plan.plugins.push_back(std::move(desc)); }
    for (auto &setup : entry.plan.setups) { result.plan.setups.push_back(std::move(setup)); }
    result.seen_plugins = std::move(entry.seen_plugins);
    result.seen_setups = std::move(entry.seen_setups);
  }

  return std::move(result.plan);
}

}  // namespace pakt
