#pragma once

#include "installer.h"

#include <filesystem>
#include <string>
#include <vector>

namespace pakt {

// Installs each plugin as a git clone under <root>/<identity>.
class git_installer : public installer {
 public:
  explicit git_installer(std::filesystem::path root);

  std::vector<std::string> install(std::vector<plugin_descriptor> const &plugins) override;
  std::vector<installed_package> list_installed() override;
  std::vector<std::string> update(std::vector<installed_package> const &packages) override;

  std::filesystem::path path_for(std::string const &identity) const { return root_ / identity; }
  std::filesystem::path const &root() const { return root_; }

 private:
  void clone(plugin_descriptor const &desc, std::filesystem::path const &dest);
  void fast_forward(installed_package const &pkg);

  std::filesystem::path root_;
};

}  // namespace pakt
