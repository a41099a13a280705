#pragma once

#include "installer.h"

#include <optional>
#include <string>
#include <unordered_map>

namespace pakt {

// ls-remote snapshot: full ref name ("refs/heads/main", "refs/tags/v1^{}") -> hex oid.
struct remote_state {
  std::unordered_map<std::string, std::string> refs;
  std::optional<std::string> head_ref;  // symref target of remote HEAD, if advertised
};

struct local_state {
  std::string head_revision;              // full hex oid of HEAD
  std::optional<std::string> upstream_ref;  // "refs/heads/<name>" on the remote
};

// Read-only view of a package's repository and its remote. Both calls throw
// std::runtime_error on failure and may run concurrently for distinct packages.
class repo_probe {
 public:
  virtual ~repo_probe() = default;

  virtual remote_state fetch_remote(installed_package const &pkg) = 0;
  virtual local_state read_local(installed_package const &pkg) = 0;
};

}  // namespace pakt
