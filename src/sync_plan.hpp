#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "server_config.hpp"

struct SyncOptions {
  std::string file_or_path; // empty: the whole ancestor directory
  std::string master;
  bool delete_extraneous = false;
  bool back = false;
  bool git_repo = false;
};

struct RsyncArgs {
  std::string local;  // local path spec, trailing '/' for directories
  std::string remote; // host:path spec, trailing '/' for directories
  bool delete_extraneous = false;
  bool back = false;
  bool git_repo = false;
  std::optional<std::filesystem::path> git_ignore;
  std::optional<std::filesystem::path> rsync_ignore;
};

struct SyncPlan {
  std::filesystem::path ancestor;
  std::filesystem::path local_dir;
  std::filesystem::path remote_dir;
  std::filesystem::path relative_path; // local_dir relative to ancestor's parent
  std::vector<std::string> hosts;
  bool is_directory = false;
  std::optional<std::filesystem::path> git_ignore;
  std::vector<std::vector<std::string>> commands; // one rsync argv per host
};

std::filesystem::path find_ancestor_to_sync(const std::filesystem::path& cwd,
                                            const std::vector<std::string>& sync_dirs);

// With back and several hosts only the master is kept; master is then
// mandatory.
std::vector<std::string> select_hosts(const std::vector<std::string>& hosts,
                                      bool back,
                                      const std::string& master);

std::optional<std::filesystem::path> probe_gitignore(const std::filesystem::path& local_dir);

std::vector<std::string> build_rsync_command(const RsyncArgs& args);

std::string join_command(const std::vector<std::string>& argv);

SyncPlan make_sync_plan(const ServerProfile& profile,
                        const SyncOptions& options,
                        const std::filesystem::path& cwd,
                        const std::vector<std::string>& sync_dirs,
                        const std::optional<std::filesystem::path>& rsync_ignore);
