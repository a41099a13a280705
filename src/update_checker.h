#pragma once

#include "installer.h"
#include "repo_probe.h"
#include "util.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pakt {

enum class update_phase { FETCH, COMPARE };

char const *update_phase_name(update_phase phase);

struct update_record {
  std::string identity;
  std::string local_revision;   // short hash
  std::string remote_revision;  // short hash
  std::string remote_ref;       // ref the remote revision was resolved from
  installed_package package;
};

struct update_failure {
  std::string identity;
  update_phase phase;
  std::string message;
};

struct update_progress {
  update_phase phase;
  std::string identity;
  std::size_t completed;  // within this phase, including this one
  std::size_t total;
};

struct update_check_result {
  std::vector<update_record> updates;  // input order
  std::vector<update_failure> failures;
};

using update_progress_cb_t = std::function<void(update_progress const &)>;
using update_complete_cb_t = std::function<void(update_check_result const &)>;

struct resolved_revision {
  std::string ref;
  std::string revision;  // full hex oid (or the pinned hex override)
};

// Pick the remote revision a package tracks, first hit wins:
//   1. branch_override as refs/heads/<o>, then refs/tags/<o> (peeled entry preferred),
//      then a hex override pins itself
//   2. local.upstream_ref
//   3. remote.head_ref
//   4. each fallback branch, in order
// Returns nullopt when the chain is exhausted.
std::optional<resolved_revision> resolve_remote_revision(
    remote_state const &remote,
    local_state const &local,
    std::optional<std::string> const &branch_override,
    std::vector<std::string> const &fallback_branches);

inline constexpr std::size_t kRevisionShortLen{ 7 };

std::string_view revision_short(std::string_view revision);

// Fetch and compare installed packages against their remotes, at most parallel_limit
// probe calls in flight at once.
class update_checker : unmovable {
 public:
  // Throws std::invalid_argument if parallel_limit is 0.
  update_checker(repo_probe &probe,
                 std::size_t parallel_limit,
                 std::vector<std::string> fallback_branches = { "main", "master" });

  // on_progress is serialized; on_complete is called exactly once.
  void check(std::vector<installed_package> const &packages,
             update_progress_cb_t const &on_progress,
             update_complete_cb_t const &on_complete);

  update_check_result check(std::vector<installed_package> const &packages,
                            update_progress_cb_t const &on_progress = {});

  std::size_t parallel_limit() const { return parallel_limit_; }

 private:
  repo_probe &probe_;
  std::size_t parallel_limit_;
  std::vector<std::string> fallback_branches_;
};

}  // namespace pakt
