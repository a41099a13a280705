#include "uri.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pakt {
namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

bool istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return std::ranges::equal(prefix,
                            value | std::views::take(prefix.size()),
                            {},
                            to_lower,
                            to_lower);
}

std::string_view strip_query_and_fragment(std::string_view uri) {
  auto const pos{ uri.find_first_of("?#") };
  return pos == std::string_view::npos ? uri : uri.substr(0, pos);
}

bool looks_like_scp_uri(std::string_view uri) {
  if (uri.find("://") != std::string_view::npos) { return false; }

  auto const colon{ uri.find(':') };
  if (colon == std::string_view::npos || colon + 1 >= uri.size()) { return false; }

  auto const user_host{ uri.substr(0, colon) };
  auto const at{ user_host.find('@') };

  return at != std::string_view::npos && at > 0;
}

bool is_scheme_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// "owner/repo" (or deeper "group/sub/repo"): no leading/trailing slash, no empty
// segments, no whitespace.
bool is_valid_shorthand(std::string_view value) {
  if (value.empty() || value.front() == '/' || value.back() == '/') { return false; }
  if (value.find('/') == std::string_view::npos) { return false; }
  if (value.find("//") != std::string_view::npos) { return false; }
  return std::ranges::none_of(value,
                              [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

std::optional<std::string> trim_path(std::string_view path) {
  while (!path.empty() && path.front() == '/') { path.remove_prefix(1); }
  while (!path.empty() && path.back() == '/') { path.remove_suffix(1); }
  if (path.empty()) { return std::nullopt; }
  return std::string{ path };
}

}  // namespace

bool uri_has_scheme_prefix(std::string_view value) {
  auto const pos{ value.find("://") };
  if (pos == std::string_view::npos || pos == 0) { return false; }
  if (!std::isalpha(static_cast<unsigned char>(value[0]))) { return false; }
  return std::ranges::all_of(value.substr(0, pos), is_scheme_char);
}

uri_info uri_classify(std::string_view value) {
  auto canonical{ std::string{ util_trim(value) } };
  if (canonical.empty()) { return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) }; }

  if (istarts_with(canonical, "git://") || istarts_with(canonical, "git+ssh://")) {
    return uri_info{ uri_scheme::GIT, std::move(canonical) };
  }
  if (istarts_with(canonical, "https://")) {
    return uri_info{ uri_scheme::HTTPS, std::move(canonical) };
  }
  if (istarts_with(canonical, "http://")) {
    return uri_info{ uri_scheme::HTTP, std::move(canonical) };
  }
  if (istarts_with(canonical, "ssh://") || looks_like_scp_uri(canonical)) {
    return uri_info{ uri_scheme::SSH, std::move(canonical) };
  }
  if (istarts_with(canonical, "file://")) {
    return uri_info{ uri_scheme::LOCAL_FILE, std::move(canonical) };
  }
  if (canonical.find("://") != std::string::npos) {
    return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) };
  }

  return uri_info{ uri_scheme::SHORTHAND, std::move(canonical) };
}

std::string uri_expand_source(std::string_view value, std::string_view default_host) {
  auto info{ uri_classify(value) };

  switch (info.scheme) {
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS:
    case uri_scheme::GIT:
    case uri_scheme::SSH:
    case uri_scheme::LOCAL_FILE: return std::move(info.canonical);

    case uri_scheme::SHORTHAND: {
      if (!is_valid_shorthand(info.canonical)) {
        throw std::invalid_argument("plugin source '" + info.canonical +
                                    "' is neither a URL nor an owner/repo shorthand");
      }
      std::string expanded{ default_host };
      if (!expanded.empty() && expanded.back() != '/') { expanded.push_back('/'); }
      return expanded + info.canonical;
    }

    case uri_scheme::UNKNOWN: break;
  }

  if (info.canonical.empty()) { throw std::invalid_argument("plugin source is empty"); }
  throw std::invalid_argument("plugin source '" + info.canonical +
                              "' uses an unsupported URL scheme");
}

std::optional<std::string> uri_path(std::string_view uri) {
  auto const trimmed{ strip_query_and_fragment(util_trim(uri)) };
  if (trimmed.empty()) { return std::nullopt; }

  if (auto const scheme_end{ trimmed.find("://") }; scheme_end != std::string_view::npos) {
    auto const rest{ trimmed.substr(scheme_end + 3) };
    if (istarts_with(trimmed, "file://")) { return trim_path(rest); }

    auto const slash{ rest.find('/') };
    if (slash == std::string_view::npos) { return std::nullopt; }
    return trim_path(rest.substr(slash));
  }

  if (looks_like_scp_uri(trimmed)) { return trim_path(trimmed.substr(trimmed.find(':') + 1)); }

  return trim_path(trimmed);  // shorthand is already a bare path
}

}  // namespace pakt
