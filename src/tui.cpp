#include "tui.h"

#include "platform.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using pakt::tui::level;
using pakt::tui::progress_line;

namespace {

constexpr std::chrono::milliseconds kFlushInterval{ 33 };
constexpr int kBarChars{ 20 };

struct log_record {
  std::chrono::system_clock::time_point when;
  level severity;
  std::string text;
};

// Everything the worker thread shares with callers. `mutex` guards the pending
// records and the progress line; `stdout_mutex` serializes print_stdout().
struct tui_state {
  std::mutex mutex;
  std::mutex stdout_mutex;
  std::condition_variable cv;
  std::thread worker;

  std::vector<log_record> pending;
  std::optional<progress_line> progress;
  bool progress_dirty{ false };

  std::function<void(std::string_view)> output_handler;
  std::optional<level> threshold;
  std::atomic_bool stop_requested{ false };
  bool decorated{ false };
  bool initialized{ false };

  // Worker-only: whether a progress line is currently drawn on stderr.
  bool progress_drawn{ false };
};

tui_state s_state{};

char const *severity_tag(level value) {
  switch (value) {
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2024-05-01 12:00:00.042] [INF] "
std::string decoration(log_record const &rec) {
  auto const secs{ std::chrono::time_point_cast<std::chrono::seconds>(rec.when) };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(rec.when - secs) };

  std::time_t const t{ std::chrono::system_clock::to_time_t(rec.when) };
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[32]{};
  if (std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char out[64]{};
  std::snprintf(out,
                sizeof out,
                "[%s.%03d] [%s] ",
                stamp,
                static_cast<int>(ms.count()),
                severity_tag(rec.severity));
  return out;
}

std::optional<std::string> vformat(char const *fmt, va_list args) {
  va_list measure;
  va_copy(measure, args);
  int const len{ std::vsnprintf(nullptr, 0, fmt, measure) };
  va_end(measure);
  if (len < 0) { return std::nullopt; }

  std::string text(static_cast<std::size_t>(len) + 1, '\0');
  std::vsnprintf(text.data(), text.size(), fmt, args);
  text.resize(static_cast<std::size_t>(len));
  return text;
}

void enqueue(level severity, char const *fmt, va_list args) {
  if (!s_state.initialized || !fmt) { return; }
  if (s_state.threshold && severity < *s_state.threshold) { return; }

  auto text{ vformat(fmt, args) };
  if (!text) { return; }

  {
    std::lock_guard lock{ s_state.mutex };
    s_state.pending.push_back(log_record{ .when = std::chrono::system_clock::now(),
                                          .severity = severity,
                                          .text = std::move(*text) });
  }
  s_state.cv.notify_one();
}

bool progress_visible() { return !s_state.output_handler && pakt::platform::is_tty(); }

// Called by the worker with no lock held. Log lines print above the progress line:
// erase it, write the records, then redraw it.
void write_out(std::vector<log_record> const &records,
               std::optional<progress_line> const &progress,
               bool progress_changed) {
  bool const draw_progress{ progress_visible() };
  bool const redraw{ draw_progress && (progress_changed || !records.empty()) };

  if (redraw && s_state.progress_drawn) {
    std::fputs("\r\x1b[K", stderr);
    s_state.progress_drawn = false;
  }

  for (auto const &rec : records) {
    std::string line{ s_state.decorated ? decoration(rec) : std::string{} };
    line += rec.text;
    line += '\n';

    if (s_state.output_handler) {
      s_state.output_handler(line);
    } else {
      std::fwrite(line.data(), 1, line.size(), stderr);
    }
  }

  if (redraw && progress) {
    std::string const bar{ pakt::tui::render_progress_line(*progress,
                                                            pakt::platform::terminal_width()) };
    std::fwrite(bar.data(), 1, bar.size(), stderr);
    s_state.progress_drawn = true;
  }

  if (!s_state.output_handler) { std::fflush(stderr); }
}

void flush_once() {
  std::vector<log_record> records;
  std::optional<progress_line> progress;
  bool changed{ false };
  {
    std::lock_guard lock{ s_state.mutex };
    records.swap(s_state.pending);
    progress = s_state.progress;
    changed = std::exchange(s_state.progress_dirty, false);
  }

  try {
    write_out(records, progress, changed);
  } catch (std::exception const &e) {
    std::fprintf(stderr, "[tui output failed: %s]\n", e.what());
    std::fflush(stderr);
  }
}

void worker_main() {
  while (!s_state.stop_requested) {
    flush_once();

    std::unique_lock lock{ s_state.mutex };
    s_state.cv.wait_for(lock, kFlushInterval, [] {
      return s_state.stop_requested.load() || !s_state.pending.empty() ||
             s_state.progress_dirty;
    });
  }

  {
    std::lock_guard lock{ s_state.mutex };
    s_state.progress.reset();
    s_state.progress_dirty = true;
  }
  flush_once();
}

}  // namespace

namespace pakt::tui {

void init() {
  if (s_state.initialized) { throw std::logic_error{ "pakt::tui::init called twice" }; }
  s_state.threshold.reset();
  s_state.decorated = false;
  s_state.initialized = true;
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_state.initialized) { throw std::logic_error{ "pakt::tui::run called before init" }; }
  if (s_state.worker.joinable()) {
    throw std::logic_error{ "pakt::tui::run called while already running" };
  }

  s_state.threshold = threshold;
  s_state.decorated = decorated_logging;
  s_state.stop_requested = false;
  s_state.worker = std::thread{ worker_main };
}

void shutdown() {
  if (!s_state.worker.joinable()) {
    throw std::logic_error{ "pakt::tui::shutdown called while not running" };
  }

  s_state.stop_requested = true;
  s_state.cv.notify_all();
  s_state.worker.join();
  s_state.worker = std::thread{};
  s_state.stop_requested = false;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  if (!s_state.initialized) {
    throw std::logic_error{ "pakt::tui::set_output_handler called before init" };
  }
  if (s_state.worker.joinable()) {
    throw std::logic_error{ "pakt::tui::set_output_handler called while running" };
  }

  std::lock_guard lock{ s_state.mutex };
  s_state.output_handler = std::move(handler);
}

bool is_tty() { return platform::is_tty(); }

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  enqueue(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard lock{ s_state.stdout_mutex };
  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);
  if (written > 0) { std::fflush(stdout); }
}

void progress_set(progress_line line) {
  {
    std::lock_guard lock{ s_state.mutex };
    s_state.progress = std::move(line);
    s_state.progress_dirty = true;
  }
  s_state.cv.notify_one();
}

void progress_clear() {
  {
    std::lock_guard lock{ s_state.mutex };
    if (!s_state.progress) { return; }
    s_state.progress.reset();
    s_state.progress_dirty = true;
  }
  s_state.cv.notify_one();
}

std::string render_progress_line(progress_line const &line, int width) {
  int const filled{ line.total == 0 ? kBarChars
                                    : static_cast<int>(line.completed * kBarChars / line.total) };

  std::string out{ line.label };
  out += ' ';
  out += std::to_string(line.completed);
  out += '/';
  out += std::to_string(line.total);
  out += " [";
  for (int i{ 0 }; i < kBarChars; ++i) { out += i < filled ? '=' : (i == filled ? '>' : ' '); }
  out += ']';

  if (!line.status.empty()) {
    out += ' ';
    out += line.status;
  }

  if (width > 0 && out.size() > static_cast<std::size_t>(width)) {
    auto const keep{ static_cast<std::size_t>(std::max(width - 3, 0)) };
    out.resize(keep);
    if (width > 3) { out += "..."; }
  }
  return out;
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_state.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace pakt::tui
