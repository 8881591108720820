#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto a SettingsManager. Options are "--key value" or "-alias value"
// (bool options may omit the value); bare words fill the positional slots.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "lansync",
                             std::vector<std::string> positional_keys = {"shared_dir", "peer_port"});

  // Applies argv on top of whatever `settings` already holds. On a bad
  // argument prints the problem and the usage text and returns false.
  bool parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  bool apply(const std::vector<std::string>& args, SettingsManager& settings, std::string& problem) const;
  static bool looks_like_option(const std::string& token);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
