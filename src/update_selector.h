#pragma once

#include "installer.h"
#include "update_checker.h"

#include <cstdio>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pakt {

struct select_all {};

struct update_selection {
  std::variant<select_all, std::vector<std::string>> choice;

  bool is_all() const { return std::holds_alternative<select_all>(choice); }
};

// Chooses which divergent packages to update. nullopt cancels.
class update_selector {
 public:
  virtual ~update_selector() = default;
  virtual std::optional<update_selection> select(std::vector<update_record> const &records) = 0;
};

// Selection fixed up front, e.g. from command-line arguments.
class static_selector : public update_selector {
 public:
  explicit static_selector(std::optional<update_selection> selection)
      : selection_{ std::move(selection) } {}

  std::optional<update_selection> select(std::vector<update_record> const &records) override;

 private:
  std::optional<update_selection> selection_;
};

// Lists records and reads a choice from `in`: space- or comma-separated indices or
// identities, "a" for all, empty line (or EOF) to cancel.
class prompt_selector : public update_selector {
 public:
  explicit prompt_selector(std::FILE *in = stdin) : in_{ in } {}

  std::optional<update_selection> select(std::vector<update_record> const &records) override;

 private:
  std::FILE *in_;
};

// Resolve selection against records and hand the chosen packages to the installer.
// Unknown names are warned about and dropped. Returns identities updated.
std::vector<std::string> dispatch_updates(installer &inst,
                                          std::vector<update_record> const &records,
                                          std::optional<update_selection> const &selection);

}  // namespace pakt
