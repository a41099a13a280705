#include "update_checker.h"

#include "tui.h"

#include <tbb/flow_graph.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace pakt {
namespace {

bool is_hex_revision(std::string_view value) {
  return value.size() >= kRevisionShortLen && value.size() <= 40 &&
         std::ranges::all_of(value, [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
         });
}

std::optional<resolved_revision> lookup(remote_state const &remote, std::string const &ref) {
  auto const it{ remote.refs.find(ref) };
  if (it == remote.refs.end()) { return std::nullopt; }
  return resolved_revision{ .ref = ref, .revision = it->second };
}

std::optional<resolved_revision> lookup_tag(remote_state const &remote,
                                            std::string const &name) {
  std::string const ref{ "refs/tags/" + name };
  if (auto peeled{ lookup(remote, ref + "^{}") }) {
    peeled->ref = ref;
    return peeled;
  }
  return lookup(remote, ref);
}

// Per-package slot; each TBB body writes only its own index.
struct check_slot {
  std::optional<remote_state> remote;
  std::optional<update_record> record;
};

}  // namespace

char const *update_phase_name(update_phase phase) {
  switch (phase) {
    case update_phase::FETCH: return "fetch";
    case update_phase::COMPARE: return "compare";
  }
  return "unknown";
}

std::optional<resolved_revision> resolve_remote_revision(
    remote_state const &remote,
    local_state const &local,
    std::optional<std::string> const &branch_override,
    std::vector<std::string> const &fallback_branches) {
  if (branch_override && !branch_override->empty()) {
    auto const &o{ *branch_override };
    if (auto r{ lookup(remote, "refs/heads/" + o) }) { return r; }
    if (auto r{ lookup_tag(remote, o) }) { return r; }
    if (is_hex_revision(o)) { return resolved_revision{ .ref = o, .revision = o }; }
  }

  if (local.upstream_ref) {
    if (auto r{ lookup(remote, *local.upstream_ref) }) { return r; }
  }

  if (remote.head_ref) {
    if (auto r{ lookup(remote, *remote.head_ref) }) { return r; }
  }

  for (auto const &branch : fallback_branches) {
    if (auto r{ lookup(remote, "refs/heads/" + branch) }) { return r; }
  }

  return std::nullopt;
}

std::string_view revision_short(std::string_view revision) {
  return revision.substr(0, std::min(revision.size(), kRevisionShortLen));
}

update_checker::update_checker(repo_probe &probe,
                               std::size_t parallel_limit,
                               std::vector<std::string> fallback_branches)
    : probe_{ probe },
      parallel_limit_{ parallel_limit },
      fallback_branches_{ std::move(fallback_branches) } {
  if (parallel_limit_ == 0) {
    throw std::invalid_argument("update_checker: parallel limit must be positive");
  }
}

void update_checker::check(std::vector<installed_package> const &packages,
                           update_progress_cb_t const &on_progress,
                           update_complete_cb_t const &on_complete) {
  std::vector<check_slot> slots(packages.size());
  update_check_result result;

  std::mutex mutex;  // guards result.failures, progress counters, on_progress
  std::size_t fetched{ 0 };
  std::size_t compared{ 0 };

  auto report{ [&](update_phase phase, std::size_t i, std::size_t &counter, std::size_t total) {
    std::lock_guard const lock{ mutex };
    ++counter;
    if (on_progress) {
      on_progress(update_progress{ .phase = phase,
                                   .identity = packages[i].identity,
                                   .completed = counter,
                                   .total = total });
    }
  } };

  auto fail{ [&](update_phase phase, std::size_t i, std::string message) {
    tui::warn("%s: %s failed: %s",
              packages[i].identity.c_str(),
              update_phase_name(phase),
              message.c_str());
    std::lock_guard const lock{ mutex };
    result.failures.push_back(update_failure{ .identity = packages[i].identity,
                                              .phase = phase,
                                              .message = std::move(message) });
  } };

  tbb::flow::graph graph;

  tbb::flow::function_node<std::size_t> fetch_node{
    graph, parallel_limit_, [&](std::size_t i) {
      try {
        slots[i].remote = probe_.fetch_remote(packages[i]);
      } catch (std::exception const &e) {
        fail(update_phase::FETCH, i, e.what());
      }
      report(update_phase::FETCH, i, fetched, packages.size());
      return tbb::flow::continue_msg{};
    }
  };

  for (std::size_t i{ 0 }; i < packages.size(); ++i) { fetch_node.try_put(i); }
  graph.wait_for_all();

  auto const compare_total{ static_cast<std::size_t>(
      std::ranges::count_if(slots, [](check_slot const &s) { return s.remote.has_value(); })) };

  tbb::flow::function_node<std::size_t> compare_node{
    graph, parallel_limit_, [&](std::size_t i) {
      auto const &pkg{ packages[i] };
      try {
        auto const local{ probe_.read_local(pkg) };
        auto const remote{ resolve_remote_revision(*slots[i].remote,
                                                   local,
                                                   pkg.branch_override,
                                                   fallback_branches_) };
        if (!remote) {
          throw std::runtime_error("no tracked branch found on remote");
        }

        auto const local_short{ revision_short(local.head_revision) };
        auto const remote_short{ revision_short(remote->revision) };
        if (local_short != remote_short) {
          slots[i].record = update_record{ .identity = pkg.identity,
                                           .local_revision = std::string{ local_short },
                                           .remote_revision = std::string{ remote_short },
                                           .remote_ref = remote->ref,
                                           .package = pkg };
        }
      } catch (std::exception const &e) {
        fail(update_phase::COMPARE, i, e.what());
      }
      report(update_phase::COMPARE, i, compared, compare_total);
      return tbb::flow::continue_msg{};
    }
  };

  for (std::size_t i{ 0 }; i < packages.size(); ++i) {
    if (slots[i].remote) { compare_node.try_put(i); }
  }
  graph.wait_for_all();

  for (auto &slot : slots) {
    if (slot.record) { result.updates.push_back(std::move(*slot.record)); }
  }

  if (on_complete) { on_complete(result); }
}

update_check_result update_checker::check(std::vector<installed_package> const &packages,
                                          update_progress_cb_t const &on_progress) {
  update_check_result out;
  check(packages, on_progress, [&](update_check_result const &r) { out = r; });
  return out;
}

}  // namespace pakt
