#pragma once

#include "plugin_source.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pakt {

// Flatten one source into canonical descriptors, preserving declaration order.
// Identifiers expand to absolute URLs, single plugins keep their passthrough options
// (and record `version` as the branch override), groups concatenate their entries.
// Lifecycle fields (setup, deps, events) are ignored here.
// Throws std::invalid_argument when a source string cannot be expanded.
std::vector<plugin_descriptor> normalize_source(plugin_source const &source,
                                                std::string_view default_host);

// Tracked branch, tag or commit: `version`, else a string `version` passthrough option.
std::optional<std::string> plugin_version(single_plugin const &plugin);

plugin_descriptor normalize_single(single_plugin const &plugin,
                                   std::string_view default_host);

}  // namespace pakt
