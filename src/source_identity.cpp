#include "source_identity.h"

#include "uri.h"
#include "util.h"

namespace pakt {

std::optional<std::string> source_identity(std::string_view url) {
  auto const info{ uri_classify(url) };
  if (info.scheme == uri_scheme::UNKNOWN) { return std::nullopt; }
  return uri_path(info.canonical);
}

std::optional<std::string> source_identity(std::string const &url) {
  return source_identity(std::string_view{ url });
}

std::optional<std::string> source_identity(char const *url) {
  return source_identity(std::string_view{ url });
}

std::optional<std::string> source_identity(plugin_descriptor const &desc) {
  return source_identity(desc.source);
}

std::optional<std::string> source_identity(plugin_source const &source) {
  return std::visit(match{
                        [](source_identifier const &id) { return source_identity(id.value); },
                        [](single_plugin const &plugin) { return source_identity(plugin.src); },
                        [](source_group const &group) -> std::optional<std::string> {
                          if (group.entries.empty()) { return std::nullopt; }
                          return source_identity(group.entries.front());
                        },
                    },
                    source.v);
}

}  // namespace pakt
