#pragma once
/*
 * Server profiles
 *
 * The config file is a JSON object keyed by server (cluster) name:
 *
 *   {
 *     "sync_dirs": ["common_sync", "sglang"],
 *     "gpu": { "hosts": ["gpu-a", "gpu-b"], "base_dir": "/home/me" },
 *     "dev": { "hosts": "devbox", "base_dir": "/data" }
 *   }
 *
 * "sync_dirs" is optional and overrides the default ancestor names.
 */
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ServerProfile {
  std::string name;
  std::vector<std::string> hosts;
  std::string base_dir;
};

struct LsyncConfig {
  std::vector<std::string> sync_dirs;
  nlohmann::json servers;
};

// $LSYNC_DIR, or ~/.lsync when unset.
std::filesystem::path lsync_dir();
std::filesystem::path default_config_path();
std::filesystem::path rsync_ignore_path();

const std::vector<std::string>& default_sync_dirs();

LsyncConfig parse_config(const nlohmann::json& doc);
LsyncConfig load_config(const std::filesystem::path& path);

ServerProfile find_server(const LsyncConfig& config, const std::string& name);
