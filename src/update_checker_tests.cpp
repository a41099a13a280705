#include "update_checker.h"

#include "test_support.h"

#include <doctest/doctest.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>

using namespace std::chrono_literals;
using pakt::test::oid;

namespace {

pakt::remote_state remote_with(std::initializer_list<std::pair<std::string const, std::string>> refs,
                               std::optional<std::string> head = std::nullopt) {
  return pakt::remote_state{ .refs = refs, .head_ref = std::move(head) };
}

}  // namespace

TEST_CASE("resolve_remote_revision prefers a branch override") {
  auto const remote{ remote_with({ { "refs/heads/dev", oid('a') },
                                   { "refs/heads/main", oid('b') } },
                                 "refs/heads/main") };
  pakt::local_state const local{ .head_revision = oid('c'),
                                 .upstream_ref = "refs/heads/main" };

  auto const r{ pakt::resolve_remote_revision(remote, local, "dev", { "main" }) };
  REQUIRE(r);
  CHECK(r->ref == "refs/heads/dev");
  CHECK(r->revision == oid('a'));
}

TEST_CASE("resolve_remote_revision resolves tags through the peeled entry") {
  auto const remote{ remote_with({ { "refs/tags/v1.0", oid('1') },
                                   { "refs/tags/v1.0^{}", oid('2') },
                                   { "refs/tags/v0.9", oid('9') } }) };
  pakt::local_state const local{ .head_revision = oid('c') };

  auto const peeled{ pakt::resolve_remote_revision(remote, local, "v1.0", {}) };
  REQUIRE(peeled);
  CHECK(peeled->ref == "refs/tags/v1.0");
  CHECK(peeled->revision == oid('2'));

  auto const lightweight{ pakt::resolve_remote_revision(remote, local, "v0.9", {}) };
  REQUIRE(lightweight);
  CHECK(lightweight->revision == oid('9'));
}

TEST_CASE("resolve_remote_revision pins a commit override") {
  auto const remote{ remote_with({ { "refs/heads/main", oid('b') } }) };
  pakt::local_state const local{ .head_revision = oid('c') };

  auto const r{ pakt::resolve_remote_revision(remote, local, "abc1234", { "main" }) };
  REQUIRE(r);
  CHECK(r->revision == "abc1234");
}

TEST_CASE("resolve_remote_revision walks upstream, remote head, then fallbacks") {
  auto const remote{ remote_with({ { "refs/heads/feature", oid('f') },
                                   { "refs/heads/trunk", oid('t') },
                                   { "refs/heads/master", oid('m') } },
                                 "refs/heads/trunk") };

  pakt::local_state const with_upstream{ .head_revision = oid('0'),
                                         .upstream_ref = "refs/heads/feature" };
  CHECK(pakt::resolve_remote_revision(remote, with_upstream, std::nullopt, {})->revision ==
        oid('f'));

  pakt::local_state const detached{ .head_revision = oid('0') };
  CHECK(pakt::resolve_remote_revision(remote, detached, std::nullopt, {})->revision == oid('t'));

  auto const no_head{ remote_with({ { "refs/heads/master", oid('m') } }) };
  CHECK(pakt::resolve_remote_revision(no_head, detached, std::nullopt, { "main", "master" })
            ->ref == "refs/heads/master");
}

TEST_CASE("resolve_remote_revision falls through a missing override") {
  auto const remote{ remote_with({ { "refs/heads/main", oid('b') } }) };
  pakt::local_state const local{ .head_revision = oid('c') };
  auto const r{ pakt::resolve_remote_revision(remote, local, "gone", { "main" }) };
  REQUIRE(r);
  CHECK(r->ref == "refs/heads/main");
}

TEST_CASE("resolve_remote_revision returns nullopt when nothing matches") {
  auto const remote{ remote_with({ { "refs/heads/other", oid('b') } }) };
  pakt::local_state const local{ .head_revision = oid('c') };
  CHECK_FALSE(pakt::resolve_remote_revision(remote, local, std::nullopt, { "main", "master" }));
}

TEST_CASE("revision_short keeps seven characters") {
  CHECK(pakt::revision_short(oid('a')) == "aaaaaaa");
  CHECK(pakt::revision_short("abc") == "abc");
}

TEST_CASE("update_checker rejects a zero parallel limit") {
  pakt::test::fake_probe probe;
  CHECK_THROWS_AS(pakt::update_checker(probe, 0), std::invalid_argument);
}

TEST_CASE("update_checker reports only divergent packages") {
  pakt::test::fake_probe probe;
  probe.remotes["o/same"] = remote_with({ { "refs/heads/main", oid('a') } }, "refs/heads/main");
  probe.locals["o/same"] = { .head_revision = oid('a') };
  probe.remotes["o/moved"] = remote_with({ { "refs/heads/main", oid('b') } }, "refs/heads/main");
  probe.locals["o/moved"] = { .head_revision = oid('a') };

  pakt::update_checker checker{ probe, 4 };
  auto const result{ checker.check(
      { pakt::test::make_package("o/same"), pakt::test::make_package("o/moved") }) };

  REQUIRE(result.updates.size() == 1);
  auto const &r{ result.updates[0] };
  CHECK(r.identity == "o/moved");
  CHECK(r.local_revision == "aaaaaaa");
  CHECK(r.remote_revision == "bbbbbbb");
  CHECK(r.remote_ref == "refs/heads/main");
  CHECK(r.package.identity == "o/moved");
  CHECK(result.failures.empty());
}

TEST_CASE("update_checker uses the package branch override") {
  pakt::test::fake_probe probe;
  probe.remotes["o/a"] = remote_with(
      { { "refs/heads/main", oid('b') }, { "refs/tags/v1", oid('a') } }, "refs/heads/main");
  probe.locals["o/a"] = { .head_revision = oid('a') };

  pakt::update_checker checker{ probe, 1 };
  CHECK(checker.check({ pakt::test::make_package("o/a", "v1") }).updates.empty());
  CHECK(checker.check({ pakt::test::make_package("o/a") }).updates.size() == 1);
}

TEST_CASE("update_checker bounds concurrent fetches") {
  pakt::test::fake_probe probe;
  probe.fetch_delay = 30ms;

  std::vector<pakt::installed_package> packages;
  for (int i{ 0 }; i < 5; ++i) {
    auto const id{ "o/p" + std::to_string(i) };
    probe.remotes[id] = remote_with({ { "refs/heads/main", oid('b') } }, "refs/heads/main");
    probe.locals[id] = { .head_revision = oid('a') };
    packages.push_back(pakt::test::make_package(id));
  }

  pakt::update_checker checker{ probe, 2 };
  auto const result{ checker.check(packages) };

  CHECK(probe.fetch_calls.load() == 5);
  CHECK(probe.peak_in_flight.load() <= 2);
  CHECK(probe.peak_in_flight.load() >= 1);
  REQUIRE(result.updates.size() == 5);
  for (int i{ 0 }; i < 5; ++i) {
    CHECK(result.updates[static_cast<std::size_t>(i)].identity == "o/p" + std::to_string(i));
  }
}

TEST_CASE("update_checker isolates failures and completes once") {
  pakt::test::fake_probe probe;
  probe.remotes["o/ok"] = remote_with({ { "refs/heads/main", oid('b') } }, "refs/heads/main");
  probe.locals["o/ok"] = { .head_revision = oid('a') };
  probe.fail_fetch.insert("o/down");
  probe.remotes["o/nolocal"] = remote_with({ { "refs/heads/main", oid('b') } });
  probe.remotes["o/nobranch"] = remote_with({ { "refs/heads/odd", oid('b') } });
  probe.locals["o/nobranch"] = { .head_revision = oid('a') };

  std::mutex mutex;
  std::size_t fetch_progress{ 0 };
  std::size_t compare_progress{ 0 };
  int completions{ 0 };
  pakt::update_check_result result;

  pakt::update_checker checker{ probe, 3 };
  checker.check(
      { pakt::test::make_package("o/ok"),
        pakt::test::make_package("o/down"),
        pakt::test::make_package("o/nolocal"),
        pakt::test::make_package("o/nobranch") },
      [&](pakt::update_progress const &p) {
        std::lock_guard const lock{ mutex };
        (p.phase == pakt::update_phase::FETCH ? fetch_progress : compare_progress)++;
      },
      [&](pakt::update_check_result const &r) {
        ++completions;
        result = r;
      });

  CHECK(completions == 1);
  CHECK(fetch_progress == 4);
  CHECK(compare_progress == 3);

  REQUIRE(result.updates.size() == 1);
  CHECK(result.updates[0].identity == "o/ok");

  REQUIRE(result.failures.size() == 3);
  auto const failure_for{ [&](std::string const &id) {
    return *std::ranges::find(result.failures, id, &pakt::update_failure::identity);
  } };
  CHECK(failure_for("o/down").phase == pakt::update_phase::FETCH);
  CHECK(failure_for("o/nolocal").phase == pakt::update_phase::COMPARE);
  CHECK(failure_for("o/nobranch").phase == pakt::update_phase::COMPARE);
}

TEST_CASE("update_checker completes with no packages") {
  pakt::test::fake_probe probe;
  int completions{ 0 };
  pakt::update_checker checker{ probe, 2 };
  checker.check({}, {}, [&](pakt::update_check_result const &r) {
    ++completions;
    CHECK(r.updates.empty());
  });
  CHECK(completions == 1);
}
