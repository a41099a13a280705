#include "event_bus.h"

#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("event_bus delivers events to matching listeners only") {
  pakt::event_bus bus;
  std::vector<std::string> seen;
  bus.subscribe({ "BufRead", "BufNewFile" },
                [&](pakt::event_args const &a) { seen.push_back(a.event + ":" + a.subject); });

  CHECK(bus.emit("BufRead", "init.lua") == 1);
  CHECK(bus.emit("InsertEnter") == 0);
  CHECK(bus.emit("BufNewFile", "x.txt") == 1);
  CHECK(seen == std::vector<std::string>{ "BufRead:init.lua", "BufNewFile:x.txt" });
}

TEST_CASE("event_bus unsubscribe stops delivery") {
  pakt::event_bus bus;
  int calls{ 0 };
  auto const id{ bus.subscribe({ "e" }, [&](pakt::event_args const &) { ++calls; }) };
  bus.emit("e");
  bus.unsubscribe(id);
  bus.emit("e");
  CHECK(calls == 1);
  CHECK(bus.listener_count() == 0);
  bus.unsubscribe(id);  // unknown id ignored
}

TEST_CASE("event_bus tolerates handlers unsubscribing during dispatch") {
  pakt::event_bus bus;
  int first{ 0 };
  int second{ 0 };
  pakt::event_bus::listener_id second_id{ 0 };

  bus.subscribe({ "e" }, [&](pakt::event_args const &) {
    ++first;
    bus.unsubscribe(second_id);
  });
  second_id = bus.subscribe({ "e" }, [&](pakt::event_args const &) { ++second; });

  CHECK(bus.emit("e") == 1);
  CHECK(first == 1);
  CHECK(second == 0);
}

TEST_CASE("event_bus poll runs only tasks that are due") {
  pakt::event_bus bus;
  int ran{ 0 };
  bus.defer(0ms, [&] { ++ran; });
  bus.defer(1h, [&] { ran += 100; });

  CHECK(bus.poll() == 1);
  CHECK(ran == 1);
  CHECK(bus.pending_count() == 1);
}

TEST_CASE("event_bus drain runs tasks in due order including ones queued while draining") {
  pakt::event_bus bus;
  std::vector<int> order;
  bus.defer(200ms, [&] { order.push_back(2); });
  bus.defer(5ms, [&] {
    order.push_back(1);
    bus.defer(0ms, [&] { order.push_back(3); });
  });

  CHECK(bus.drain() == 3);
  CHECK(order == std::vector<int>{ 1, 3, 2 });
  CHECK(bus.pending_count() == 0);
}

TEST_CASE("event_bus runs equal-deadline tasks in submission order") {
  pakt::event_bus bus;
  std::vector<int> order;
  for (int i{ 0 }; i < 4; ++i) {
    bus.defer(0ms, [&order, i] { order.push_back(i); });
  }
  bus.drain();
  CHECK(order == std::vector<int>{ 0, 1, 2, 3 });
}
