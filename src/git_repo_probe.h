#pragma once

#include "repo_probe.h"

namespace pakt {

// libgit2-backed probe. Never writes refs or objects: remote state comes from an
// ls-remote over a detached remote, local state from reading HEAD and branch config.
class git_repo_probe : public repo_probe {
 public:
  remote_state fetch_remote(installed_package const &pkg) override;
  local_state read_local(installed_package const &pkg) override;
};

}  // namespace pakt
