#include "command_line_parser.hpp"

#include <cctype>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(token[1]));
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::string problem;
  if(apply(args, settings, problem)) return true;
  print_err("{}", problem);
  usage(settings);
  return false;
}

bool CommandLineParser::apply(const std::vector<std::string>& args, SettingsManager& settings, std::string& problem) const {
  std::size_t next_positional = 0;
  std::string error;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(looks_like_option(token)) {
      const bool long_form = token[1] == '-';
      const std::string name = token.substr(long_form ? 2 : 1);
      auto key = settings.resolve_key(name);
      if(!key) {
        problem = "Unknown option " + token;
        return false;
      }

      std::string value = "true";
      if(settings.is_bool_setting(*key)) {
        if(i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        }
      } else if(i + 1 < args.size()) {
        value = args[++i];
      } else {
        problem = "Missing value for " + token;
        return false;
      }

      if(!settings.set_from_string(*key, value, error)) {
        problem = "Invalid value for " + token + ": " + error;
        return false;
      }
      continue;
    }

    if(next_positional >= positional_keys_.size()) {
      problem = "Unexpected argument '" + token + "'";
      return false;
    }
    const std::string& key = positional_keys_[next_positional++];
    if(!settings.set_from_string(key, token, error)) {
      problem = "Invalid " + key + " '" + token + "': " + error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_;
  for(const auto& key : positional_keys_) {
    synopsis += " [" + key + "]";
  }
  print_out("{} - LAN directory synchronization node", process_name_);
  print_out("Usage: {} [options]", synopsis);
  print_out("");
  print_out("Options:");
  for(const auto& setting : settings.definitions()) {
    std::string hint = setting.type == SettingsManager::Type::Bool
      ? "[true|false]"
      : "<" + SettingsManager::type_name(setting.type) + ">";
    std::string aliases;
    for(const auto& alias : setting.aliases) {
      aliases += aliases.empty() ? " (-" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";
    print_out("  --{:<20} {:<12} {}{} [{}]",
              setting.key, hint, setting.description, aliases,
              settings.value_as_string(setting.key));
  }
  print_out("");
}
