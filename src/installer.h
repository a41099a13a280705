#pragma once

#include "plugin_source.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pakt {

struct installed_package {
  std::string identity;
  std::filesystem::path path;
  std::string source;  // fetch URL (origin)
  std::optional<std::string> branch_override;
};

// Backend that materializes plugins on disk.
class installer {
 public:
  virtual ~installer() = default;

  // Returns identities that are present on disk afterwards (already there or fetched).
  // Per-plugin failures are reported, not thrown.
  virtual std::vector<std::string> install(std::vector<plugin_descriptor> const &plugins) = 0;

  virtual std::vector<installed_package> list_installed() = 0;

  // Bring each named package up to its tracked revision. Returns identities updated.
  virtual std::vector<std::string> update(std::vector<installed_package> const &packages) = 0;
};

}  // namespace pakt
