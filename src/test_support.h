#pragma once

// Fakes and fixtures shared by unit tests. Nothing here touches the network.

#include "installer.h"
#include "repo_probe.h"
#include "util.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pakt::test {

// Confirms every plugin unless its identity is listed in `refuse`.
struct fake_installer : installer {
  std::vector<std::string> install(std::vector<plugin_descriptor> const &plugins) override;
  std::vector<installed_package> list_installed() override { return installed; }
  std::vector<std::string> update(std::vector<installed_package> const &packages) override;

  std::unordered_set<std::string> refuse;
  std::vector<installed_package> installed;
  std::vector<std::vector<plugin_descriptor>> install_calls;
  std::vector<std::vector<installed_package>> update_calls;
};

// Serves canned remote/local state keyed by identity. Records peak concurrency of
// fetch_remote calls.
struct fake_probe : repo_probe {
  remote_state fetch_remote(installed_package const &pkg) override;
  local_state read_local(installed_package const &pkg) override;

  std::unordered_map<std::string, remote_state> remotes;
  std::unordered_map<std::string, local_state> locals;
  std::unordered_set<std::string> fail_fetch;
  std::chrono::milliseconds fetch_delay{ 0 };

  std::atomic_int in_flight{ 0 };
  std::atomic_int peak_in_flight{ 0 };
  std::atomic_int fetch_calls{ 0 };
};

installed_package make_package(std::string identity,
                               std::optional<std::string> branch_override = std::nullopt);

// 40-char hex oid built by repeating `c`.
std::string oid(char c);

// Routes tui output into `lines` while alive. Earlier queued messages may also appear,
// so assert with contains() rather than exact counts.
struct log_capture : unmovable {
  log_capture();
  ~log_capture();

  std::vector<std::string> const &stop();
  bool contains(std::string_view needle);

 private:
  std::mutex mutex_;
  std::vector<std::string> lines_;
  bool running_{ false };
};

// Fresh directory under the system temp dir, removed on destruction.
struct temp_dir : unmovable {
  temp_dir();
  ~temp_dir();

  void write(std::filesystem::path const &rel, std::string_view content) const;

  std::filesystem::path path;
};

}  // namespace pakt::test
