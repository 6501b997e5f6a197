#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Applies argv on top of a SettingsManager. Options are --key[=value] or a
// short alias (-j 5, -j5); bool options take an optional true/false word.
// Everything else is appended to the positional list setting.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "srmsync",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                             std::string positional_key = "path");

  // Throws ConfigError on unknown options or bad values.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  std::string process_name_;
  nlohmann::json settings_spec_;
  std::string positional_key_;
};
