#pragma once

#include "util.h"

#include <git2.h>

#include <memory>
#include <string>
#include <string_view>

namespace pakt {

// RAII wrapper for libgit2 global initialization/shutdown.
struct libgit2_scope : unmovable {
  libgit2_scope();
  ~libgit2_scope();
};

using git_repository_ptr_t = std::unique_ptr<git_repository, decltype(&git_repository_free)>;
using git_remote_ptr_t = std::unique_ptr<git_remote, decltype(&git_remote_free)>;
using git_object_ptr_t = std::unique_ptr<git_object, decltype(&git_object_free)>;
using git_reference_ptr_t = std::unique_ptr<git_reference, decltype(&git_reference_free)>;

// "<context>: <libgit2 last error message>"
std::string libgit2_error_message(std::string_view context);

// Throws std::runtime_error with libgit2_error_message(context) if rc != 0.
void libgit2_check(int rc, std::string_view context);

// Owns a git_buf; frees on destruction.
struct libgit2_buf : unmovable {
  ~libgit2_buf() { git_buf_dispose(&buf); }
  std::string str() const { return buf.ptr ? std::string{ buf.ptr, buf.size } : std::string{}; }

  git_buf buf = GIT_BUF_INIT;
};

std::string libgit2_oid_str(git_oid const *oid);

std::string libgit2_version();

}  // namespace pakt
