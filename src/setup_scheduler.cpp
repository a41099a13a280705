#include "setup_scheduler.h"

#include "tui.h"
#include "uri.h"

#include <exception>

namespace pakt {
namespace {

struct path_guard : unmovable {
  path_guard(std::unordered_set<std::string> &path, std::string const &identity)
      : path_{ path }, identity_{ identity } {
    path_.insert(identity_);
  }
  ~path_guard() { path_.erase(identity_); }

 private:
  std::unordered_set<std::string> &path_;
  std::string const &identity_;
};

}  // namespace

setup_scheduler::setup_scheduler(setup_registry const &registry,
                                 activation_table &table,
                                 event_bus &bus,
                                 session_cfg const &cfg)
    : registry_{ registry }, table_{ table }, bus_{ bus }, cfg_{ cfg } {}

setup_scheduler::~setup_scheduler() {
  for (auto const &[identity, w] : waiting_) { bus_.unsubscribe(w.listener); }
}

bool setup_scheduler::activate(std::string const &identity) {
  path_t active_path;
  return activate(identity, active_path);
}

std::size_t setup_scheduler::run_all() {
  std::size_t failed{ 0 };
  for (auto const &identity : registry_.identities()) {
    if (!activate(identity)) { ++failed; }
  }
  return failed;
}

bool setup_scheduler::activate(std::string const &identity, path_t &active_path) {
  auto const *desc{ registry_.find(identity) };
  if (!desc) { return true; }

  // A gated identity counts as satisfied once subscribed; its dependents do not wait
  // for the event.
  switch (table_.state(identity)) {
    case setup_state::COMPLETED:
    case setup_state::WAITING: return true;
    default: break;
  }

  if (!table_.is_installed(identity)) {
    tui::error("Setup for %s skipped: plugin is not installed", identity.c_str());
    return false;
  }

  path_guard const guard{ active_path, identity };

  for (auto const &dep : desc->dependencies) {
    if (table_.is_completed(dep)) { continue; }
    if (active_path.contains(dep)) {
      tui::error("Circular dependency detected: %s -> %s", identity.c_str(), dep.c_str());
      return false;
    }
    if (!activate(dep, active_path)) {
      tui::error("Setup for %s aborted: dependency %s failed",
                 identity.c_str(),
                 dep.c_str());
      return false;
    }
  }

  if (!desc->action) {
    table_.set_state(identity, setup_state::COMPLETED);
    return true;
  }

  if (!desc->trigger_events || desc->trigger_events->empty()) {
    return run_action(identity, *desc);
  }

  table_.set_state(identity, setup_state::WAITING);
  auto const listener{ bus_.subscribe(
      *desc->trigger_events,
      [this, identity](event_args const &args) { on_event(identity, args); }) };
  waiting_[identity] = waiter{ .listener = listener };
  tui::debug("Setup for %s waiting on %s",
             identity.c_str(),
             util_join(*desc->trigger_events, ", ").c_str());
  return true;
}

bool setup_scheduler::run_action(std::string const &identity, setup_descriptor const &desc) {
  table_.set_state(identity, setup_state::ACTIVATING);
  try {
    desc.action();
  } catch (std::exception const &e) {
    tui::error("Setup for %s failed: %s", identity.c_str(), e.what());
    table_.set_state(identity, setup_state::REGISTERED);
    return false;
  }
  table_.set_state(identity, setup_state::COMPLETED);
  tui::debug("Setup for %s completed", identity.c_str());
  return true;
}

void setup_scheduler::on_event(std::string const &identity, event_args const &args) {
  auto const it{ waiting_.find(identity) };
  if (it == waiting_.end() || it->second.scheduled) { return; }

  if (args.event != cfg_.enter_event && uri_has_scheme_prefix(args.subject)) {
    tui::debug("Ignoring %s for %s: transient buffer %s",
               args.event.c_str(),
               identity.c_str(),
               args.subject.c_str());
    return;
  }

  it->second.scheduled = true;
  bus_.defer(cfg_.debounce, [this, identity] { fire_deferred(identity); });
}

void setup_scheduler::fire_deferred(std::string const &identity) {
  auto const it{ waiting_.find(identity) };
  if (it == waiting_.end()) { return; }

  auto const listener{ it->second.listener };
  waiting_.erase(it);
  bus_.unsubscribe(listener);

  if (table_.is_completed(identity)) { return; }

  auto const *desc{ registry_.find(identity) };
  if (!desc || !desc->action) { return; }
  run_action(identity, *desc);
}

}  // namespace pakt
