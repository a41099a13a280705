#include "tui.h"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(pakt::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(pakt::tui::set_output_handler(handler));
  CHECK_NOTHROW(pakt::tui::run(pakt::tui::level::TUI_INFO));
  CHECK_NOTHROW(pakt::tui::shutdown());

  CHECK_NOTHROW(pakt::tui::run(std::nullopt));
  CHECK_THROWS_AS(pakt::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(pakt::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(pakt::tui::shutdown());
  CHECK_THROWS_AS(pakt::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(pakt::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    // Drop anything queued by earlier tests while the worker was idle.
    pakt::tui::set_output_handler([](std::string_view) {});
    pakt::tui::run(std::nullopt);
    pakt::tui::shutdown();

    pakt::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      pakt::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui undecorated logs are raw messages") {
  CHECK_NOTHROW(pakt::tui::run(std::nullopt));

  pakt::tui::debug("hello %s", "world");
  pakt::tui::info("value %d", 42);
  pakt::tui::warn("three %d", 3);
  pakt::tui::error("boom");

  CHECK_NOTHROW(pakt::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui decorated logs include level prefix") {
  CHECK_NOTHROW(pakt::tui::run(pakt::tui::level::TUI_DEBUG, true));
  pakt::tui::info("structured %d", 7);
  CHECK_NOTHROW(pakt::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.find("[INF") != std::string::npos);
  CHECK(line.rfind("structured 7\n") == line.size() - std::string("structured 7\n").size());
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(pakt::tui::run(pakt::tui::level::TUI_WARN, true));
  pakt::tui::debug("debug");
  pakt::tui::info("info");
  pakt::tui::warn("warn");
  pakt::tui::error("error");
  CHECK_NOTHROW(pakt::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui formats long messages") {
  std::string const long_text(4000, 'x');
  CHECK_NOTHROW(pakt::tui::run(std::nullopt));
  pakt::tui::info("%s!", long_text.c_str());
  CHECK_NOTHROW(pakt::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == long_text + "!\n");
}

TEST_CASE_FIXTURE(captured_output, "tui progress line never reaches the output handler") {
  CHECK_NOTHROW(pakt::tui::run(std::nullopt));
  pakt::tui::progress_set({ .label = "fetch", .completed = 1, .total = 2, .status = "o/r" });
  pakt::tui::info("logged");
  pakt::tui::progress_clear();
  CHECK_NOTHROW(pakt::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "logged\n");
}

TEST_CASE("tui render_progress_line") {
  SUBCASE("partial") {
    auto const line{ pakt::tui::render_progress_line(
        { .label = "fetch", .completed = 1, .total = 4, .status = "owner/repo" }, 0) };
    CHECK(line == "fetch 1/4 [=====>              ] owner/repo");
  }

  SUBCASE("complete") {
    auto const line{ pakt::tui::render_progress_line(
        { .label = "compare", .completed = 3, .total = 3 }, 0) };
    CHECK(line == "compare 3/3 [====================]");
  }

  SUBCASE("truncated to width") {
    auto const line{ pakt::tui::render_progress_line(
        { .label = "fetch", .completed = 0, .total = 2, .status = "a/very/long/identity" }, 20) };
    CHECK(line.size() == 20);
    CHECK(line.ends_with("..."));
  }
}
