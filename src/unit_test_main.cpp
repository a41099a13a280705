#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "tui.h"

#include <git2.h>

#include <string_view>

int main(int argc, char **argv) {
  doctest::Context context;
  context.applyCommandLine(argc, argv);

  pakt::tui::init();
  pakt::tui::set_output_handler([](std::string_view) {});

  git_libgit2_init();
  int const rc{ context.run() };
  git_libgit2_shutdown();
  return rc;
}
