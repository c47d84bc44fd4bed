#include "command_line_parser.hpp"

#include <cctype>
#include <stdexcept>

#include "log.hpp"

namespace {

constexpr const char* kPositionalKey = "file_or_path";

void store(SettingsManager& settings, const std::string& key,
           const std::string& token, const std::string& value) {
  std::string error;
  if(!settings.set_from_string(key, value, error)) {
    throw std::invalid_argument("Invalid value for '" + token + "': " + error);
  }
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name)
  : process_name_(std::move(process_name)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return true;
  return token.size() >= 2 && token[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(token[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  bool positional_taken = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(looks_like_option(token)) {
      std::string name = token.substr(token[1] == '-' ? 2 : 1);
      auto eq = name.find('=');
      if(eq != std::string::npos) {
        auto key = settings.resolve_key(name.substr(0, eq));
        if(!key) throw std::invalid_argument("Unknown option " + token.substr(0, token.find('=')));
        store(settings, *key, token, name.substr(eq + 1));
        continue;
      }

      auto key = settings.resolve_key(name);
      if(!key) throw std::invalid_argument("Unknown option " + token);

      if(settings.is_bool_setting(*key)) {
        // A following literal is consumed; anything else leaves the flag set.
        bool has_literal = i + 1 < args.size() && !looks_like_option(args[i + 1]) &&
                           SettingsManager::is_bool_literal(args[i + 1]);
        store(settings, *key, token, has_literal ? args[++i] : "true");
        continue;
      }
      if(i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for option " + token);
      }
      store(settings, *key, token, args[++i]);
      continue;
    }

    if(positional_taken) {
      throw std::invalid_argument("Unexpected positional argument '" + token + "'");
    }
    store(settings, kPositionalKey, token, token);
    positional_taken = true;
  }
}

void CommandLineParser::usage() const {
  print_out("{} - sync a project folder to one or more hosts with rsync", process_name_);
  print_out("Usage:");
  print_out("  {} --server <name> [{}]", process_name_, kPositionalKey);
  print_out("");
  print_out("Options:");
  for(const auto& entry : SETTINGS_SPECIFICATION) {
    const auto type = entry.at("type").get<std::string>();
    std::string aliases;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";

    const auto& default_value = entry.at("default");
    std::string default_str = default_value.is_string()
      ? default_value.get<std::string>()
      : default_value.dump();
    print_out("  --{} {:<12} {}{} (default: {})",
              entry.at("key").get<std::string>(),
              type == "bool" ? "[true|false]" : "<" + type + ">",
              entry.value("description", ""),
              aliases,
              default_str);
  }
  print_out("");
}
