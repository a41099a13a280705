#include "libgit2_util.h"

#include <stdexcept>

namespace pakt {

libgit2_scope::libgit2_scope() { git_libgit2_init(); }
libgit2_scope::~libgit2_scope() { git_libgit2_shutdown(); }

std::string libgit2_error_message(std::string_view context) {
  std::string msg{ context };
  if (git_error const *git_err{ git_error_last() }; git_err && git_err->message) {
    msg += ": ";
    msg += git_err->message;
  }
  return msg;
}

void libgit2_check(int rc, std::string_view context) {
  if (rc != 0) { throw std::runtime_error(libgit2_error_message(context)); }
}

std::string libgit2_oid_str(git_oid const *oid) {
  char buf[GIT_OID_HEXSZ + 1]{};
  git_oid_tostr(buf, sizeof(buf), oid);
  return buf;
}

std::string libgit2_version() {
  int major{ 0 }, minor{ 0 }, rev{ 0 };
  git_libgit2_version(&major, &minor, &rev);
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(rev);
}

}  // namespace pakt
