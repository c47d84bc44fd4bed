#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","server"},        {"aliases", {"n"}},           {"type","string"}, {"default",""},    {"description","Server (cluster) name in the config file"}},
  {{"key","file_or_path"},  {"aliases", {"f"}},           {"type","string"}, {"default",""},    {"description","File or directory to sync, relative to the current directory"}},
  {{"key","master"},        {"aliases", {"m"}},           {"type","string"}, {"default",""},    {"description","Host to pull from when syncing back from several hosts"}},
  {{"key","delete"},        {"aliases", {"d"}},           {"type","bool"},   {"default",false}, {"description","Delete extraneous files on the receiving side"}},
  {{"key","back"},                                        {"type","bool"},   {"default",false}, {"description","Sync from remote to local"}},
  {{"key","git"},           {"aliases", {"g","git_repo"}},{"type","bool"},   {"default",false}, {"description","Sync the .git directory too"}},
  {{"key","config"},        {"aliases", {"c"}},           {"type","string"}, {"default",""},    {"description","Server config file (default <lsync_dir>/lsync_config.json)"}},
  {{"key","yes"},           {"aliases", {"y"}},           {"type","bool"},   {"default",false}, {"description","Start without waiting for Enter"}},
  {{"key","drain_on_exit"}, {"aliases", {"drain"}},       {"type","bool"},   {"default",false}, {"description","Show output still buffered when a transfer exits"}},
  {{"key","poll_idle_us"},  {"aliases", {"idle"}},        {"type","int"},    {"default",1000},  {"description","Microseconds to sleep when no transfer produced output (0 = busy poll)"}},
  {{"key","verbose"},       {"aliases", {"v"}},           {"type","bool"},   {"default",false}, {"description","Enable verbose logging"}},
  {{"key","help"},          {"aliases", {"h","?"}},       {"type","bool"},   {"default",false}, {"description","Show command help and exit"}}
});

class SettingsManager {
public:
  SettingsManager();

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  // Merges user defaults from a JSON object file. A missing file is not an
  // error; unknown keys are ignored.
  bool load_from_file(const std::filesystem::path& path);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : setting_specs_(build_setting_specs(SETTINGS_SPECIFICATION)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  // Command lines spell keys with dashes, the table with underscores.
  std::string lowered = to_lower(token);
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err("Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err("Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "trailing characters after integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
