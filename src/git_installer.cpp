#include "git_installer.h"

#include "libgit2_util.h"
#include "source_identity.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace pakt {
namespace {

// Returns nullptr on failure (no throw).
git_repository *try_git_clone(std::string const &url,
                              std::filesystem::path const &dest,
                              char const *checkout_branch) {
  git_clone_options clone_opts;
  git_clone_options_init(&clone_opts, GIT_CLONE_OPTIONS_VERSION);
  clone_opts.checkout_branch = checkout_branch;

  git_repository *repo_raw{ nullptr };
  if (git_clone(&repo_raw, url.c_str(), dest.string().c_str(), &clone_opts)) {
    return nullptr;
  }
  return repo_raw;
}

// Try each spelling of ref in order. Returns nullptr if none resolves.
git_object *try_resolve_ref(git_repository *repo, std::string const &ref) {
  for (auto const &candidate : { "refs/remotes/origin/" + ref, "refs/tags/" + ref, ref }) {
    if (git_object *obj{ nullptr }; !git_revparse_single(&obj, repo, candidate.c_str())) {
      return obj;
    }
  }
  return nullptr;
}

void checkout_detached(git_repository *repo, git_object *target) {
  git_checkout_options checkout_opts;
  git_checkout_options_init(&checkout_opts, GIT_CHECKOUT_OPTIONS_VERSION);
  checkout_opts.checkout_strategy = GIT_CHECKOUT_FORCE;

  libgit2_check(git_checkout_tree(repo, target, &checkout_opts), "checkout failed");
  libgit2_check(git_repository_set_head_detached(repo, git_object_id(target)),
                "failed to update HEAD");
}

git_repository_ptr_t open_repo(std::filesystem::path const &path) {
  git_repository *raw{ nullptr };
  libgit2_check(git_repository_open(&raw, path.string().c_str()),
                "cannot open repository " + path.string());
  return { raw, git_repository_free };
}

void remove_partial_clone(std::filesystem::path const &dest) {
  std::error_code ec;
  std::filesystem::remove_all(dest, ec);
  if (ec) { tui::warn("could not remove %s: %s", dest.string().c_str(), ec.message().c_str()); }
}

}  // namespace

git_installer::git_installer(std::filesystem::path root) : root_{ std::move(root) } {}

void git_installer::clone(plugin_descriptor const &desc, std::filesystem::path const &dest) {
  std::filesystem::create_directories(dest.parent_path());

  char const *branch{ desc.branch_override ? desc.branch_override->c_str() : nullptr };
  git_repository *repo_raw{ try_git_clone(desc.source, dest, branch) };
  if (repo_raw || !branch) {
    if (!repo_raw) { throw std::runtime_error(libgit2_error_message("clone failed")); }
    git_repository_free(repo_raw);
    return;
  }

  // Override is not a branch: clone the default branch, then pin to tag or commit.
  remove_partial_clone(dest);
  repo_raw = try_git_clone(desc.source, dest, nullptr);
  if (!repo_raw) { throw std::runtime_error(libgit2_error_message("clone failed")); }
  git_repository_ptr_t repo{ repo_raw, git_repository_free };

  git_object *target_raw{ try_resolve_ref(repo.get(), *desc.branch_override) };
  if (!target_raw) {
    throw std::runtime_error(
        libgit2_error_message("failed to resolve version '" + *desc.branch_override + "'"));
  }
  git_object_ptr_t target{ target_raw, git_object_free };
  checkout_detached(repo.get(), target.get());
}

std::vector<std::string> git_installer::install(std::vector<plugin_descriptor> const &plugins) {
  std::vector<std::string> confirmed;

  for (auto const &desc : plugins) {
    auto const identity{ source_identity(desc) };
    if (!identity) {
      tui::error("Cannot install %s: no identity", desc.source.c_str());
      continue;
    }

    auto const dest{ path_for(*identity) };
    if (std::filesystem::exists(dest / ".git")) {
      tui::debug("%s already installed", identity->c_str());
      confirmed.push_back(*identity);
      continue;
    }

    tui::info("Installing %s from %s", identity->c_str(), desc.source.c_str());
    try {
      clone(desc, dest);
      confirmed.push_back(*identity);
    } catch (std::exception const &e) {
      tui::error("Failed to install %s: %s", identity->c_str(), e.what());
      remove_partial_clone(dest);
    }
  }

  return confirmed;
}

std::vector<installed_package> git_installer::list_installed() {
  std::vector<installed_package> out;

  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) { return out; }

  std::filesystem::recursive_directory_iterator it{ root_, ec };
  for (; !ec && it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
    if (!it->is_directory() || !std::filesystem::exists(it->path() / ".git")) { continue; }
    it.disable_recursion_pending();

    installed_package pkg{ .identity = it->path().lexically_relative(root_).generic_string(),
                           .path = it->path() };
    try {
      auto repo{ open_repo(pkg.path) };
      git_remote *remote_raw{ nullptr };
      libgit2_check(git_remote_lookup(&remote_raw, repo.get(), "origin"), "no origin remote");
      git_remote_ptr_t remote{ remote_raw, git_remote_free };
      if (char const *url{ git_remote_url(remote.get()) }) { pkg.source = url; }
    } catch (std::exception const &e) {
      tui::warn("%s: %s", pkg.identity.c_str(), e.what());
    }
    out.push_back(std::move(pkg));
  }
  if (ec) { tui::warn("Error scanning %s: %s", root_.string().c_str(), ec.message().c_str()); }

  std::ranges::sort(out, {}, &installed_package::identity);
  return out;
}

void git_installer::fast_forward(installed_package const &pkg) {
  auto repo{ open_repo(pkg.path) };

  git_remote *remote_raw{ nullptr };
  libgit2_check(git_remote_lookup(&remote_raw, repo.get(), "origin"), "no origin remote");
  git_remote_ptr_t remote{ remote_raw, git_remote_free };
  libgit2_check(git_remote_fetch(remote.get(), nullptr, nullptr, "pakt: fetch"), "fetch failed");

  if (git_repository_head_detached(repo.get()) == 1) {
    if (!pkg.branch_override) {
      throw std::runtime_error("HEAD is detached and no version is tracked");
    }
    git_object *target_raw{ try_resolve_ref(repo.get(), *pkg.branch_override) };
    if (!target_raw) {
      throw std::runtime_error(
          libgit2_error_message("failed to resolve version '" + *pkg.branch_override + "'"));
    }
    git_object_ptr_t target{ target_raw, git_object_free };
    checkout_detached(repo.get(), target.get());
    return;
  }

  git_reference *head_raw{ nullptr };
  libgit2_check(git_repository_head(&head_raw, repo.get()), "cannot read HEAD");
  git_reference_ptr_t head{ head_raw, git_reference_free };

  git_reference *upstream_raw{ nullptr };
  libgit2_check(git_branch_upstream(&upstream_raw, head.get()), "branch has no upstream");
  git_reference_ptr_t upstream{ upstream_raw, git_reference_free };

  git_oid const *head_oid{ git_reference_target(head.get()) };
  git_oid const *upstream_oid{ git_reference_target(upstream.get()) };
  if (!head_oid || !upstream_oid) { throw std::runtime_error("symbolic reference in the way"); }
  if (git_oid_equal(head_oid, upstream_oid)) { return; }

  if (git_graph_descendant_of(repo.get(), upstream_oid, head_oid) != 1) {
    throw std::runtime_error("local branch has diverged from upstream; not fast-forwarding");
  }

  git_object *target_raw{ nullptr };
  libgit2_check(git_object_lookup(&target_raw, repo.get(), upstream_oid, GIT_OBJECT_COMMIT),
                "cannot load upstream commit");
  git_object_ptr_t target{ target_raw, git_object_free };

  git_checkout_options checkout_opts;
  git_checkout_options_init(&checkout_opts, GIT_CHECKOUT_OPTIONS_VERSION);
  checkout_opts.checkout_strategy = GIT_CHECKOUT_FORCE;
  libgit2_check(git_checkout_tree(repo.get(), target.get(), &checkout_opts), "checkout failed");

  git_reference *moved_raw{ nullptr };
  libgit2_check(git_reference_set_target(&moved_raw, head.get(), upstream_oid, "pakt: fast-forward"),
                "cannot move branch");
  git_reference_free(moved_raw);
}

std::vector<std::string> git_installer::update(std::vector<installed_package> const &packages) {
  std::vector<std::string> updated;
  for (auto const &pkg : packages) {
    tui::info("Updating %s", pkg.identity.c_str());
    try {
      fast_forward(pkg);
      updated.push_back(pkg.identity);
    } catch (std::exception const &e) {
      tui::error("Failed to update %s: %s", pkg.identity.c_str(), e.what());
    }
  }
  return updated;
}

}  // namespace pakt
