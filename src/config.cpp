#include "config.h"

#include <stdexcept>

namespace pakt {

void session_cfg_validate(session_cfg const &cfg) {
  if (cfg.parallel_limit == 0) {
    throw std::invalid_argument("config: parallel limit must be a positive integer");
  }
  if (cfg.default_host.empty()) {
    throw std::invalid_argument("config: default_host cannot be empty");
  }
  if (cfg.enter_event.empty()) {
    throw std::invalid_argument("config: enter_event cannot be empty");
  }
  if (cfg.debounce.count() < 0) {
    throw std::invalid_argument("config: debounce_ms cannot be negative");
  }
  for (auto const &branch : cfg.fallback_branches) {
    if (branch.empty()) {
      throw std::invalid_argument("config: fallback_branches cannot contain empty names");
    }
  }
}

}  // namespace pakt
