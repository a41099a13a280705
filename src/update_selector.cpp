#include "update_selector.h"

#include "tui.h"
#include "util.h"

#include <algorithm>
#include <charconv>

namespace pakt {
namespace {

std::optional<std::string> read_line(std::FILE *in) {
  std::string line;
  for (int c{ std::fgetc(in) }; c != EOF; c = std::fgetc(in)) {
    if (c == '\n') { return line; }
    line.push_back(static_cast<char>(c));
  }
  if (line.empty()) { return std::nullopt; }
  return line;
}

}  // namespace

std::optional<update_selection> static_selector::select(std::vector<update_record> const &) {
  return selection_;
}

std::optional<update_selection> prompt_selector::select(
    std::vector<update_record> const &records) {
  if (records.empty()) { return std::nullopt; }

  tui::progress_clear();
  for (std::size_t i{ 0 }; i < records.size(); ++i) {
    auto const &r{ records[i] };
    tui::print_stdout("%3zu) %s  %s -> %s (%s)\n",
                      i + 1,
                      r.identity.c_str(),
                      r.local_revision.c_str(),
                      r.remote_revision.c_str(),
                      r.remote_ref.c_str());
  }
  tui::print_stdout("Update which? [numbers or names, a = all, empty = cancel]: ");
  std::fflush(stdout);

  auto const line{ read_line(in_) };
  if (!line) { return std::nullopt; }

  std::string normalized{ *line };
  std::ranges::replace(normalized, ',', ' ');
  auto const trimmed{ util_trim(normalized) };
  if (trimmed.empty()) { return std::nullopt; }
  if (trimmed == "a" || trimmed == "all") { return update_selection{ select_all{} }; }

  std::vector<std::string> names;
  for (auto &token : util_split(trimmed, ' ')) {
    std::size_t index{ 0 };
    auto const [ptr, ec]{ std::from_chars(token.data(), token.data() + token.size(), index) };
    if (ec == std::errc{} && ptr == token.data() + token.size() && index >= 1 &&
        index <= records.size()) {
      names.push_back(records[index - 1].identity);
    } else {
      names.push_back(std::move(token));
    }
  }
  return update_selection{ std::move(names) };
}

std::vector<std::string> dispatch_updates(installer &inst,
                                          std::vector<update_record> const &records,
                                          std::optional<update_selection> const &selection) {
  if (!selection) {
    tui::info("Update cancelled");
    return {};
  }

  std::vector<installed_package> chosen;
  if (selection->is_all()) {
    for (auto const &r : records) { chosen.push_back(r.package); }
  } else {
    for (auto const &name : std::get<std::vector<std::string>>(selection->choice)) {
      auto const it{ std::ranges::find(records, name, &update_record::identity) };
      if (it == records.end()) {
        tui::warn("%s has no pending update; skipping", name.c_str());
        continue;
      }
      if (std::ranges::find(chosen, name, &installed_package::identity) == chosen.end()) {
        chosen.push_back(it->package);
      }
    }
  }

  if (chosen.empty()) {
    tui::info("Nothing to update");
    return {};
  }
  return inst.update(chosen);
}

}  // namespace pakt
