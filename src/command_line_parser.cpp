#include "command_line_parser.hpp"

#include <cctype>
#include <set>

#include <spdlog/fmt/ranges.h>

#include "log.hpp"
#include "sync_errors.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' && !std::isdigit(static_cast<unsigned char>(token[1]));
}

bool is_bool_word(const std::string& token) {
  static const std::set<std::string> words = {"true", "false", "on", "off", "yes", "no", "1", "0"};
  return words.count(SettingsManager::to_lower(SettingsManager::trim_copy(token))) > 0;
}

std::string describe_default(const nlohmann::json& value) {
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return text.empty() ? "none" : text;
  }
  if(value.is_array() && value.empty()) return "none";
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     std::string positional_key)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_key_(std::move(positional_key)) {
  if(!SettingsManager(settings_spec_).is_list_setting(positional_key_)) {
    throw std::invalid_argument("Positional setting '" + positional_key_ + "' must be a list setting");
  }
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  for(int i = 1; argv && i < argc; ++i) args.emplace_back(argv[i]);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  // a list given on the command line replaces the one from the settings file
  std::set<std::string> replaced_lists;
  auto assign = [&](const std::string& key, const std::string& value, const std::string& shown_as) {
    if(settings.is_list_setting(key) && replaced_lists.insert(key).second) {
      settings.clear_list(key);
    }
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw ConfigError(fmt::format("Invalid value '{}' for {}: {}", value, shown_as, error));
    }
  };

  std::size_t i = 0;
  auto next_value = [&](const std::string& shown_as) -> std::string {
    if(i + 1 >= args.size()) {
      throw ConfigError("Missing value for option " + shown_as);
    }
    return args[++i];
  };

  for(; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(!looks_like_option(token)) {
      assign(positional_key_, token, positional_key_);
      continue;
    }

    const bool long_form = token.rfind("--", 0) == 0;
    std::string name = token.substr(long_form ? 2 : 1);
    std::optional<std::string> attached;
    if(long_form) {
      auto eq = name.find('=');
      if(eq != std::string::npos) {
        attached = name.substr(eq + 1);
        name.erase(eq);
      }
    } else if(!settings.resolve_key(name)) {
      // -j5: short alias with the number glued on
      auto digit = name.find_first_of("0123456789");
      if(digit != std::string::npos && digit > 0) {
        auto key = settings.resolve_key(name.substr(0, digit));
        if(key && *key != positional_key_ && !settings.is_bool_setting(*key)) {
          attached = name.substr(digit);
          name.erase(digit);
        }
      }
    }

    const std::string shown_as = (long_form ? "--" : "-") + name;
    auto key = settings.resolve_key(name);
    if(!key || *key == positional_key_) {
      throw ConfigError("Unknown option " + shown_as);
    }

    if(attached) {
      assign(*key, *attached, shown_as);
    } else if(settings.is_bool_setting(*key)) {
      const bool has_word = i + 1 < args.size() && !looks_like_option(args[i + 1]) && is_bool_word(args[i + 1]);
      assign(*key, has_word ? args[++i] : "true", shown_as);
    } else {
      assign(*key, next_value(shown_as), shown_as);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - mirror a remote SRM tree or LFN lists onto local disk", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Usage: {} [options] {}...", process_name_, positional_key_);
  print_out(nullptr, "  each {} is a file with one LFN per line, or a directory below --srm", positional_key_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    if(key == positional_key_) continue;
    const auto type = entry.at("type").get<std::string>();

    std::vector<std::string> spellings{"--" + key};
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      spellings.push_back((alias.size() == 1 ? "-" : "--") + alias);
    }
    const std::string hint = type == "bool" ? "" : " <" + type + ">";
    print_out(nullptr, "  {}{}", fmt::join(spellings, ", "), hint);
    print_out(nullptr, "      {}{} (default: {})",
              entry.value("description", ""),
              type == "list" ? ", repeatable" : "",
              describe_default(entry.at("default")));
  }
}
