#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace pakt {

struct session_cfg {
  std::size_t parallel_limit{ 4 };  // concurrent remote fetches during update checks
  std::string default_host{ "https://github.com/" };

  // true: each install drains the registration queue (independent batches).
  // false: the queue is kept and every install re-plans everything registered so far.
  bool clear_queue_after_install{ true };

  std::string enter_event{ "enter" };  // exempt from the transient-buffer filter
  std::chrono::milliseconds debounce{ 10 };
  std::vector<std::string> fallback_branches{ "main", "master" };
};

// Throws std::invalid_argument describing the first bad field.
void session_cfg_validate(session_cfg const &cfg);

}  // namespace pakt
