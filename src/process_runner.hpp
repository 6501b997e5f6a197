#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

// Environment handed to the external tools (loaded from the --gfalenv file).
// Variables are layered over the inherited environment, unless replace is set,
// in which case the child sees only these variables.
struct EnvOverlay {
  std::map<std::string, std::string> variables;
  bool replace = false;

  bool empty() const { return variables.empty() && !replace; }
};

struct CommandResult {
  bool launched = false;
  int exit_code = -1;
  std::string out;
  std::string err;
  std::string launch_error;

  bool ok() const { return launched && exit_code == 0; }
};

// Runs argv[0] (looked up in PATH) and waits for it, capturing stdout and stderr.
// Never throws for a failing child; spawn problems are reported in launch_error.
CommandResult run_command(const std::vector<std::string>& argv,
                          const EnvOverlay& env = EnvOverlay{});

using CommandRunner = std::function<CommandResult(const std::vector<std::string>& argv,
                                                  const EnvOverlay& env)>;

CommandRunner default_command_runner();

// Reads a JSON object {"NAME": "value", ...}. Non-string scalars are stringified.
// Throws ConfigError when the file is missing or not an object.
EnvOverlay load_env_overlay(const std::filesystem::path& path, bool replace = false);

std::string format_command(const std::vector<std::string>& argv);

// "gfal-ls -l" -> {"gfal-ls", "-l"}
std::vector<std::string> split_command(const std::string& command);
