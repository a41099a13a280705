#pragma once

#include "plugin_source.h"

#include <optional>
#include <string>
#include <string_view>

namespace pakt {

// Stable plugin key: the URL path after the host ("owner/repo"). Shorthand sources
// are already in that form. nullopt means the input carries no usable source and the
// caller should skip it.
std::optional<std::string> source_identity(std::string_view url);
std::optional<std::string> source_identity(std::string const &url);
std::optional<std::string> source_identity(char const *url);
std::optional<std::string> source_identity(plugin_descriptor const &desc);

// Groups resolve through their first entry.
std::optional<std::string> source_identity(plugin_source const &source);

}  // namespace pakt
