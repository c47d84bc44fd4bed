#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SETTINGS_SPECIFICATION. Accepted forms:
//   --key value, --key=value, -alias value, a bool flag with or without a
//   literal, and one bare positional taken as file_or_path.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "lsync");

  // Throws std::invalid_argument on unknown options, missing values, values
  // of the wrong type or a second positional.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  static bool looks_like_option(const std::string& token);

  std::string process_name_;
};
