#include "sync_plan.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

fs::path find_ancestor_to_sync(const fs::path& cwd, const std::vector<std::string>& sync_dirs) {
  fs::path dir = cwd.lexically_normal();
  if(!dir.empty() && !dir.has_filename()) {
    dir = dir.parent_path(); // "/a/b/" -> "/a/b"
  }
  while(!dir.empty() && dir != dir.root_path()) {
    const auto name = dir.filename().string();
    if(std::find(sync_dirs.begin(), sync_dirs.end(), name) != sync_dirs.end()) {
      return dir;
    }
    dir = dir.parent_path();
  }

  std::string names;
  for(const auto& name : sync_dirs) {
    if(!names.empty()) names += ", ";
    names += name;
  }
  throw ConfigError("No ancestor directory in [" + names + "] found in " + cwd.string());
}

std::vector<std::string> select_hosts(const std::vector<std::string>& hosts,
                                      bool back,
                                      const std::string& master) {
  if(!back || hosts.size() <= 1) return hosts;
  if(master.empty()) {
    throw ConfigError("master must be set when syncing back");
  }
  std::vector<std::string> selected;
  std::copy_if(hosts.begin(), hosts.end(), std::back_inserter(selected),
               [&](const std::string& host){ return host == master; });
  if(selected.empty()) {
    throw ConfigError("master '" + master + "' is not one of the configured hosts");
  }
  return selected;
}

std::optional<fs::path> probe_gitignore(const fs::path& local_dir) {
  std::error_code ec;
  auto candidate = local_dir / ".gitignore";
  if(fs::exists(candidate, ec)) return candidate;
  return std::nullopt;
}

std::vector<std::string> build_rsync_command(const RsyncArgs& args) {
  std::vector<std::string> argv = {"rsync", "-ah"};
  if(args.delete_extraneous) argv.emplace_back("--delete");
  argv.emplace_back("--info=progress2");
  if(args.git_ignore) {
    argv.push_back("--exclude-from=" + args.git_ignore->string());
  }
  if(args.rsync_ignore && !args.back) {
    argv.push_back("--exclude-from=" + args.rsync_ignore->string());
  }
  if(!args.git_repo) argv.emplace_back("--exclude=.git");

  if(args.back) {
    argv.push_back(args.remote);
    argv.push_back(args.local);
  } else {
    argv.push_back(args.local);
    argv.push_back(args.remote);
  }
  return argv;
}

std::string join_command(const std::vector<std::string>& argv) {
  std::string out;
  for(const auto& arg : argv) {
    if(!out.empty()) out += ' ';
    out += arg;
  }
  return out;
}

SyncPlan make_sync_plan(const ServerProfile& profile,
                        const SyncOptions& options,
                        const fs::path& cwd,
                        const std::vector<std::string>& sync_dirs,
                        const std::optional<fs::path>& rsync_ignore) {
  SyncPlan plan;
  plan.ancestor = find_ancestor_to_sync(cwd, sync_dirs);

  if(options.file_or_path.empty()) {
    plan.local_dir = plan.ancestor;
    plan.relative_path = plan.ancestor.filename();
  } else {
    plan.local_dir = (cwd / options.file_or_path).lexically_normal();
    if(!plan.local_dir.has_filename()) {
      plan.local_dir = plan.local_dir.parent_path();
    }
    plan.relative_path = plan.local_dir.lexically_relative(plan.ancestor.parent_path());
    if(plan.relative_path.empty() || plan.relative_path == "." ||
       *plan.relative_path.begin() == "..") {
      throw ConfigError(plan.local_dir.string() + " is outside " + plan.ancestor.string());
    }
  }
  plan.remote_dir = fs::path(profile.base_dir) / plan.relative_path;

  plan.hosts = select_hosts(profile.hosts, options.back, options.master);
  plan.git_ignore = probe_gitignore(plan.local_dir);

  std::error_code ec;
  plan.is_directory = fs::is_directory(plan.local_dir, ec);
  const std::string suffix = plan.is_directory ? "/" : "";

  for(const auto& host : plan.hosts) {
    RsyncArgs args;
    args.local = plan.local_dir.generic_string() + suffix;
    args.remote = host + ":" + plan.remote_dir.generic_string() + suffix;
    args.delete_extraneous = options.delete_extraneous;
    args.back = options.back;
    args.git_repo = options.git_repo;
    args.git_ignore = plan.git_ignore;
    args.rsync_ignore = rsync_ignore;
    plan.commands.push_back(build_rsync_command(args));
  }
  return plan;
}
