#include "event_bus.h"

#include <algorithm>
#include <thread>

namespace pakt {

event_bus::listener_id event_bus::subscribe(std::vector<std::string> events,
                                            event_handler_t handler) {
  auto const id{ next_listener_id_++ };
  listeners_.push_back(
      listener{ .id = id, .events = std::move(events), .handler = std::move(handler) });
  return id;
}

void event_bus::unsubscribe(listener_id id) {
  std::erase_if(listeners_, [id](listener const &l) { return l.id == id; });
}

bool event_bus::is_subscribed(listener_id id) const {
  return std::ranges::any_of(listeners_, [id](listener const &l) { return l.id == id; });
}

std::size_t event_bus::emit(std::string_view event, std::string_view subject) {
  // Snapshot so handlers can unsubscribe themselves (or others) mid-dispatch.
  std::vector<std::pair<listener_id, event_handler_t>> matching;
  for (auto const &l : listeners_) {
    if (std::find(l.events.begin(), l.events.end(), event) != l.events.end()) {
      matching.emplace_back(l.id, l.handler);
    }
  }

  event_args const args{ .event = std::string{ event }, .subject = std::string{ subject } };

  std::size_t invoked{ 0 };
  for (auto const &[id, handler] : matching) {
    if (!is_subscribed(id)) { continue; }
    handler(args);
    ++invoked;
  }
  return invoked;
}

void event_bus::defer(std::chrono::milliseconds delay, std::function<void()> task) {
  deferred_.push_back(deferred_task{ .due = clock::now() + delay,
                                     .seq = next_seq_++,
                                     .task = std::move(task) });
}

bool event_bus::run_next_due(clock::time_point now) {
  auto const next{ std::ranges::min_element(deferred_, [](auto const &a, auto const &b) {
    return a.due != b.due ? a.due < b.due : a.seq < b.seq;
  }) };
  if (next == deferred_.end() || next->due > now) { return false; }

  auto task{ std::move(next->task) };
  deferred_.erase(next);
  task();
  return true;
}

std::size_t event_bus::poll() {
  std::size_t ran{ 0 };
  auto const now{ clock::now() };
  while (run_next_due(now)) { ++ran; }
  return ran;
}

std::size_t event_bus::drain() {
  std::size_t ran{ 0 };
  while (!deferred_.empty()) {
    auto const earliest{ std::ranges::min_element(deferred_, {}, &deferred_task::due)->due };
    std::this_thread::sleep_until(earliest);
    while (run_next_due(clock::now())) { ++ran; }
  }
  return ran;
}

}  // namespace pakt
