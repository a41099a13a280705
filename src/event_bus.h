#pragma once

#include "util.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace pakt {

struct event_args {
  std::string event;
  std::string subject;  // file or buffer the event fired for (may be empty)
};

using event_handler_t = std::function<void(event_args const &)>;

// Named runtime events with persistent listeners, plus a queue of deferred tasks.
// Single-threaded: emit(), poll() and drain() run handlers and tasks on the caller's
// thread. Handlers may subscribe, unsubscribe, emit or defer reentrantly.
class event_bus : unmovable {
 public:
  using listener_id = std::uint64_t;
  using clock = std::chrono::steady_clock;

  listener_id subscribe(std::vector<std::string> events, event_handler_t handler);
  void unsubscribe(listener_id id);  // unknown ids are ignored

  // Returns number of listeners invoked.
  std::size_t emit(std::string_view event, std::string_view subject = {});

  void defer(std::chrono::milliseconds delay, std::function<void()> task);

  // Run deferred tasks whose due time has passed. Returns number run.
  std::size_t poll();

  // Run every deferred task, sleeping until each one is due, including tasks queued
  // while draining. Returns number run.
  std::size_t drain();

  std::size_t listener_count() const { return listeners_.size(); }
  std::size_t pending_count() const { return deferred_.size(); }

 private:
  struct listener {
    listener_id id;
    std::vector<std::string> events;
    event_handler_t handler;
  };

  struct deferred_task {
    clock::time_point due;
    std::uint64_t seq;
    std::function<void()> task;
  };

  bool is_subscribed(listener_id id) const;
  bool run_next_due(clock::time_point now);

  std::vector<listener> listeners_;
  std::vector<deferred_task> deferred_;
  listener_id next_listener_id_{ 1 };
  std::uint64_t next_seq_{ 0 };
};

}  // namespace pakt
