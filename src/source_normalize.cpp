#include "source_normalize.h"

#include "uri.h"
#include "util.h"

namespace pakt {
namespace {

void append_normalized(plugin_source const &source,
                       std::string_view default_host,
                       std::vector<plugin_descriptor> &out) {
  std::visit(match{
                 [&](source_identifier const &id) {
                   out.push_back(plugin_descriptor{
                       .source = uri_expand_source(id.value, default_host) });
                 },
                 [&](single_plugin const &plugin) {
                   out.push_back(normalize_single(plugin, default_host));
                 },
                 [&](source_group const &group) {
                   for (auto const &entry : group.entries) {
                     append_normalized(entry, default_host, out);
                   }
                 },
             },
             source.v);
}

}  // namespace

std::optional<std::string> plugin_version(single_plugin const &plugin) {
  if (plugin.version) { return plugin.version; }
  if (auto const it{ plugin.options.find("version") };
      it != plugin.options.end() && std::holds_alternative<std::string>(it->second)) {
    return std::get<std::string>(it->second);
  }
  return std::nullopt;
}

plugin_descriptor normalize_single(single_plugin const &plugin,
                                   std::string_view default_host) {
  plugin_descriptor desc{ .source = uri_expand_source(plugin.src, default_host),
                          .branch_override = plugin_version(plugin),
                          .options = plugin.options };
  if (plugin.version) { desc.options["version"] = *plugin.version; }
  return desc;
}

std::vector<plugin_descriptor> normalize_source(plugin_source const &source,
                                                std::string_view default_host) {
  std::vector<plugin_descriptor> out;
  append_normalized(source, default_host, out);
  return out;
}

}  // namespace pakt
