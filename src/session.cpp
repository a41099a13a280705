#include "session.h"

#include "install_plan.h"
#include "source_identity.h"
#include "source_normalize.h"
#include "tui.h"

namespace pakt {

session::session(session_cfg cfg) : cfg_{ std::move(cfg) } {}

void session::add(plugin_source source) {
  record_overrides(source);
  queue_.push_back(std::move(source));
}

// Same walk order as the install plan (deps before their plugin, first occurrence
// wins), so check and update see the version install would have used.
void session::record_overrides(plugin_source const &source) {
  std::visit(match{
                 [](source_identifier const &) {},
                 [this](single_plugin const &plugin) {
                   for (auto const &dep : plugin.deps) { record_overrides(dep); }
                   auto version{ plugin_version(plugin) };
                   if (!version) { return; }
                   if (auto id{ source_identity(plugin.src) }) {
                     branch_overrides_.try_emplace(*id, std::move(*version));
                   }
                 },
                 [this](source_group const &group) {
                   for (auto const &entry : group.entries) { record_overrides(entry); }
                 },
             },
             source.v);
}

install_summary session::install(installer &inst) {
  session_cfg_validate(cfg_);

  auto plan{ build_install_plan(queue_, cfg_.default_host) };
  if (cfg_.clear_queue_after_install) { queue_.clear(); }

  install_summary summary{ .planned = plan.plugins.size(), .skipped = plan.skipped };

  for (auto &s : plan.setups) {
    if (registry_.add(s.identity, std::move(s.desc))) { table_.mark_registered(s.identity); }
  }

  auto const confirmed{ inst.install(plan.plugins) };
  for (auto const &id : confirmed) { table_.mark_installed(id); }
  summary.installed = confirmed.size();
  tui::info("Installed %zu of %zu plugins", summary.installed, summary.planned);

  if (!scheduler_) {
    scheduler_ = std::make_unique<setup_scheduler>(registry_, table_, bus_, cfg_);
  }
  summary.setup_failures = scheduler_->run_all();
  return summary;
}

std::vector<installed_package> session::tracked_packages(installer &inst) const {
  auto packages{ inst.list_installed() };
  for (auto &pkg : packages) {
    if (auto const it{ branch_overrides_.find(pkg.identity) }; it != branch_overrides_.end()) {
      pkg.branch_override = it->second;
    }
  }
  return packages;
}

update_check_result session::check_updates(installer &inst,
                                           repo_probe &probe,
                                           update_progress_cb_t const &on_progress) {
  session_cfg_validate(cfg_);
  update_checker checker{ probe, cfg_.parallel_limit, cfg_.fallback_branches };
  return checker.check(tracked_packages(inst), on_progress);
}

std::vector<std::string> session::update(installer &inst,
                                         repo_probe &probe,
                                         update_selector &selector,
                                         update_progress_cb_t const &on_progress) {
  auto const result{ check_updates(inst, probe, on_progress) };
  if (result.updates.empty()) {
    tui::info("All plugins are up to date");
    return {};
  }
  return dispatch_updates(inst, result.updates, selector.select(result.updates));
}

}  // namespace pakt
