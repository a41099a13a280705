#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define PAKT_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define PAKT_TUI_PRINTF(idx, first)
#endif

namespace pakt::tui {

enum class level { TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

void init();
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

void debug(char const *fmt, ...) PAKT_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) PAKT_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) PAKT_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) PAKT_TUI_PRINTF(1, 2);

void print_stdout(char const *fmt, ...) PAKT_TUI_PRINTF(1, 2);

bool is_tty();

// Single transient progress line, redrawn under the log on a terminal and never
// written to a redirected output handler or a pipe.
struct progress_line {
  std::string label;  // e.g. "fetch"
  std::size_t completed{ 0 };
  std::size_t total{ 0 };
  std::string status;  // e.g. the identity being checked
};

void progress_set(progress_line line);
void progress_clear();

// "label  3/7 [=====>    ] status", truncated to `width` columns when width > 0.
std::string render_progress_line(progress_line const &line, int width);

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace pakt::tui

#undef PAKT_TUI_PRINTF
