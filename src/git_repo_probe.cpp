#include "git_repo_probe.h"

#include "libgit2_util.h"

#include <stdexcept>

namespace pakt {
namespace {

struct remote_connection : unmovable {
  explicit remote_connection(git_remote *r) : remote{ r } {}
  ~remote_connection() { git_remote_disconnect(remote); }
  git_remote *remote;
};

}  // namespace

remote_state git_repo_probe::fetch_remote(installed_package const &pkg) {
  if (pkg.source.empty()) { throw std::runtime_error("no remote URL recorded"); }

  git_remote *remote_raw{ nullptr };
  libgit2_check(git_remote_create_detached(&remote_raw, pkg.source.c_str()),
                "invalid remote " + pkg.source);
  git_remote_ptr_t remote{ remote_raw, git_remote_free };

  git_remote_callbacks callbacks;
  git_remote_init_callbacks(&callbacks, GIT_REMOTE_CALLBACKS_VERSION);
  libgit2_check(
      git_remote_connect(remote.get(), GIT_DIRECTION_FETCH, &callbacks, nullptr, nullptr),
      "cannot reach " + pkg.source);
  remote_connection const connection{ remote.get() };

  git_remote_head const **heads{ nullptr };
  std::size_t count{ 0 };
  libgit2_check(git_remote_ls(&heads, &count, remote.get()), "ls-remote failed");

  remote_state state;
  for (std::size_t i{ 0 }; i < count; ++i) {
    std::string const name{ heads[i]->name };
    if (name == "HEAD") {
      if (heads[i]->symref_target) { state.head_ref = heads[i]->symref_target; }
      continue;
    }
    state.refs.emplace(name, libgit2_oid_str(&heads[i]->oid));
  }

  if (!state.head_ref) {
    libgit2_buf default_branch;
    if (git_remote_default_branch(&default_branch.buf, remote.get()) == 0) {
      state.head_ref = default_branch.str();
    }
  }

  return state;
}

local_state git_repo_probe::read_local(installed_package const &pkg) {
  git_repository *repo_raw{ nullptr };
  libgit2_check(git_repository_open(&repo_raw, pkg.path.string().c_str()),
                "cannot open repository " + pkg.path.string());
  git_repository_ptr_t repo{ repo_raw, git_repository_free };

  git_oid head_oid;
  libgit2_check(git_reference_name_to_id(&head_oid, repo.get(), "HEAD"), "cannot resolve HEAD");

  local_state state{ .head_revision = libgit2_oid_str(&head_oid) };

  if (git_repository_head_detached(repo.get()) == 1) { return state; }

  git_reference *head_raw{ nullptr };
  libgit2_check(git_repository_head(&head_raw, repo.get()), "cannot read HEAD");
  git_reference_ptr_t head{ head_raw, git_reference_free };

  libgit2_buf merge;
  int const rc{ git_branch_upstream_merge(&merge.buf, repo.get(), git_reference_name(head.get())) };
  if (rc == 0) {
    state.upstream_ref = merge.str();
  } else if (rc != GIT_ENOTFOUND) {
    throw std::runtime_error(libgit2_error_message("cannot read upstream"));
  }

  return state;
}

}  // namespace pakt
