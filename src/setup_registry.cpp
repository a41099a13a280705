#include "setup_registry.h"

#include <stdexcept>

namespace pakt {

char const *setup_state_name(setup_state state) {
  switch (state) {
    case setup_state::UNREGISTERED: return "unregistered";
    case setup_state::REGISTERED: return "registered";
    case setup_state::WAITING: return "waiting";
    case setup_state::ACTIVATING: return "activating";
    case setup_state::COMPLETED: return "completed";
  }
  return "unknown";
}

bool setup_registry::add(std::string const &identity, setup_descriptor desc) {
  if (identity.empty()) { throw std::invalid_argument("setup_registry: empty identity"); }

  auto const [it, inserted]{ descriptors_.try_emplace(identity, std::move(desc)) };
  if (inserted) { order_.push_back(identity); }
  return inserted;
}

setup_descriptor const *setup_registry::find(std::string_view identity) const {
  auto const it{ descriptors_.find(std::string{ identity }) };
  return it == descriptors_.end() ? nullptr : &it->second;
}

void activation_table::mark_installed(std::string const &identity) {
  states_[identity].installed = true;
}

void activation_table::mark_registered(std::string const &identity) {
  auto &s{ states_[identity] };
  if (s.state == setup_state::UNREGISTERED) { s.state = setup_state::REGISTERED; }
}

void activation_table::set_state(std::string const &identity, setup_state state) {
  auto &s{ states_[identity] };
  if (s.state == setup_state::COMPLETED && state != setup_state::COMPLETED) {
    throw std::logic_error("activation_table: " + identity + " is already completed");
  }
  s.state = state;
}

plugin_state const *activation_table::find(std::string_view identity) const {
  auto const it{ states_.find(std::string{ identity }) };
  return it == states_.end() ? nullptr : &it->second;
}

bool activation_table::is_installed(std::string_view identity) const {
  auto const *s{ find(identity) };
  return s && s->installed;
}

setup_state activation_table::state(std::string_view identity) const {
  auto const *s{ find(identity) };
  return s ? s->state : setup_state::UNREGISTERED;
}

}  // namespace pakt
