#include "server_config.hpp"

#include <cstdlib>
#include <fstream>

namespace {

const char* kSyncDirsKey = "sync_dirs";

} // namespace

std::filesystem::path lsync_dir() {
  if(const char* dir = std::getenv("LSYNC_DIR"); dir && *dir) {
    return std::filesystem::path(dir);
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".lsync";
  }
  return std::filesystem::current_path() / ".lsync";
}

std::filesystem::path default_config_path() {
  return lsync_dir() / "lsync_config.json";
}

std::filesystem::path rsync_ignore_path() {
  return lsync_dir() / ".rsyncignore";
}

const std::vector<std::string>& default_sync_dirs() {
  static const std::vector<std::string> dirs = {"common_sync", "sglang", "docker_workspace"};
  return dirs;
}

LsyncConfig parse_config(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    throw ConfigError("config must be a JSON object keyed by server name");
  }
  LsyncConfig config;
  config.sync_dirs = default_sync_dirs();
  config.servers = nlohmann::json::object();
  for(const auto& item : doc.items()) {
    if(item.key() == kSyncDirsKey) {
      if(!item.value().is_array()) {
        throw ConfigError("'sync_dirs' must be an array of directory names");
      }
      config.sync_dirs.clear();
      for(const auto& name : item.value()) {
        if(!name.is_string()) throw ConfigError("'sync_dirs' entries must be strings");
        config.sync_dirs.push_back(name.get<std::string>());
      }
      continue;
    }
    config.servers[item.key()] = item.value();
  }
  return config;
}

LsyncConfig load_config(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw ConfigError("Unable to read config " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw ConfigError("Failed to parse " + path.string() + ": " + e.what());
  }
  return parse_config(doc);
}

ServerProfile find_server(const LsyncConfig& config, const std::string& name) {
  if(name.empty() || !config.servers.contains(name)) {
    throw ConfigError("Invalid server(cluster) name: " + name);
  }
  const auto& entry = config.servers.at(name);
  if(!entry.is_object()) {
    throw ConfigError("server '" + name + "' must be an object");
  }

  ServerProfile profile;
  profile.name = name;

  const auto hosts = entry.find("hosts");
  if(hosts == entry.end()) {
    throw ConfigError("server '" + name + "' has no 'hosts'");
  }
  if(hosts->is_string()) {
    profile.hosts.push_back(hosts->get<std::string>());
  } else if(hosts->is_array()) {
    for(const auto& host : *hosts) {
      if(!host.is_string()) throw ConfigError("server '" + name + "' has a non-string host");
      profile.hosts.push_back(host.get<std::string>());
    }
  } else {
    throw ConfigError("server '" + name + "' 'hosts' must be a string or an array");
  }
  if(profile.hosts.empty()) {
    throw ConfigError("server '" + name + "' lists no hosts");
  }

  const auto base_dir = entry.find("base_dir");
  if(base_dir == entry.end() || !base_dir->is_string()) {
    throw ConfigError("server '" + name + "' needs a string 'base_dir'");
  }
  profile.base_dir = base_dir->get<std::string>();
  return profile;
}
