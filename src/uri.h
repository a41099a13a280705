#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pakt {

enum class uri_scheme {
  HTTP,
  HTTPS,
  GIT,
  SSH,
  LOCAL_FILE,
  SHORTHAND,  // "owner/repo", expanded against the default host
  UNKNOWN
};

struct uri_info {
  uri_scheme scheme;
  std::string canonical;
};

uri_info uri_classify(std::string_view value);

// Expand a plugin source string to an absolute fetch URL. Recognized schemes pass
// through unchanged; "owner/repo" shorthand is appended to default_host.
// Throws std::invalid_argument for empty input, malformed shorthand, or an unknown
// "scheme://" prefix.
std::string uri_expand_source(std::string_view value, std::string_view default_host);

// Path portion after the host: "https://host/owner/repo" -> "owner/repo",
// "git@host:owner/repo" -> "owner/repo". Query strings and fragments are dropped.
// Returns nullopt when there is no path component.
std::optional<std::string> uri_path(std::string_view uri);

// True for values like "oil:///tmp" or "term://bash" that name a virtual buffer
// rather than a file on disk.
bool uri_has_scheme_prefix(std::string_view value);

}  // namespace pakt
