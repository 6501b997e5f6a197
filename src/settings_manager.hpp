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
  {{"key","srm"},            {"aliases", {"s"}},                {"type","string"}, {"default",""},          {"description","SRM server with storage root"}, {"persistent", true}},
  {{"key","dest"},           {"aliases", {"o","d"}},            {"type","string"}, {"default","."},         {"description","Destination directory"}, {"persistent", true}},
  {{"key","lfn_strip"},      {"aliases", {"lfn-strip"}},        {"type","list"},   {"default",nlohmann::json::array()}, {"description","Leading part of the LFN to replace by dest (repeatable)"}, {"persistent", true}},
  {{"key","filter"},         {"aliases", {"f"}},                {"type","string"}, {"default","*.root"},    {"description","Glob for file names"}, {"persistent", true}},
  {{"key","exclude"},        {"aliases", {"x"}},                {"type","list"},   {"default",nlohmann::json::array()}, {"description","Glob for file names to skip (repeatable)"}, {"persistent", true}},
  {{"key","dirfilter"},      {"aliases", {"dir-filter"}},       {"type","list"},   {"default",nlohmann::json::array()}, {"description","Glob for directory names, GLOB (level 1) or LEVEL:GLOB (repeatable)"}, {"persistent", true}},
  {{"key","max_depth"},      {"aliases", {"max-depth","depth"}},{"type","int"},    {"default",1},           {"description","Maximum depth to scan"}, {"persistent", true}},
  {{"key","gfalenv"},        {"aliases", {"env"}},              {"type","string"}, {"default",""},          {"description","JSON file with environment variables for the gfal tools"}, {"persistent", true}},
  {{"key","gfalenv_replace"},{"aliases", {"clean-env"}},        {"type","bool"},   {"default",false},       {"description","Run gfal tools with only the gfalenv variables"}, {"persistent", true}},
  {{"key","jobs"},           {"aliases", {"j","nprocesses"}},   {"type","int"},    {"default",1},           {"description","Number of parallel downloads"}, {"persistent", true}},
  {{"key","list_jobs"},      {"aliases", {"list-jobs","lj"}},   {"type","int"},    {"default",10},          {"description","Number of parallel listing calls"}, {"persistent", true}},
  {{"key","ls_command"},     {"aliases", {"ls-command"}},       {"type","string"}, {"default","srmls"},     {"description","Directory listing command"}, {"persistent", true}},
  {{"key","lfn_ls_command"}, {"aliases", {"lfn-ls-command"}},   {"type","string"}, {"default","gfal-ls -l"},{"description","Long listing command used for LFN lists"}, {"persistent", true}},
  {{"key","copy_command"},   {"aliases", {"copy-command"}},     {"type","string"}, {"default","gfal-copy"}, {"description","Copy command"}, {"persistent", true}},
  {{"key","local_list"},     {"aliases", {"local-list"}},       {"type","string"}, {"default",""},          {"description","Write the local path of every file to this (new) file"}, {"persistent", false}},
  {{"key","log_file"},       {"aliases", {"log-file"}},         {"type","string"}, {"default",""},          {"description","Also write log lines to this file"}, {"persistent", true}},
  {{"key","dry_run"},        {"aliases", {"n","dry-run"}},      {"type","bool"},   {"default",false},       {"description","Print the files that would be downloaded"}, {"persistent", false}},
  {{"key","verbose"},        {"aliases", {"v"}},                {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","path"},           {"aliases", nlohmann::json::array()}, {"type","list"}, {"default",nlohmann::json::array()}, {"description","LFN list file or path below srm to synchronize"}, {"persistent", false}},
  {{"key","help"},           {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},           {"aliases", {"persist"}},          {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, String, List };

struct SettingSpec {
  std::string key;
  std::vector<std::string> aliases;
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  bool persistent = true;
};

// Typed view over SETTINGS_SPECIFICATION. Values come from the defaults, then
// the saved settings file, then the command line. Keys and aliases match
// case-insensitively and '-' is accepted for '_'.
class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification = SETTINGS_SPECIFICATION);

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::out_of_range("Unknown setting: " + key);
    }
    return it->get<T>();
  }

  // Lists grow by one element per call.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  void clear_list(const std::string& key);

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  bool is_list_setting(const std::string& key) const;

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  // .config/srmsync.json below the working directory unless overridden.
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

  // False when there is no readable settings file.
  bool load();
  // Writes the persistent settings only.
  bool save() const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  const SettingSpec* find_spec(const std::string& token) const;
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);

  std::vector<SettingSpec> specs_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
};

inline SettingType setting_type_from_name(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "list") return SettingType::List;
  if(name == "string") return SettingType::String;
  throw std::invalid_argument("Unknown setting type '" + name + "'");
}

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      spec.aliases.push_back(to_lower(alias));
    }
    spec.type = setting_type_from_name(entry.at("type").get<std::string>());
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
    values_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

inline const SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(token);
  std::string as_key = lowered;
  std::replace(as_key.begin(), as_key.end(), '-', '_');
  for(const auto& spec : specs_) {
    if(spec.key == as_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) return &spec;
  }
  return nullptr;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  const auto* spec = find_spec(token);
  if(!spec) return std::nullopt;
  return spec->key;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == SettingType::Bool;
}

inline bool SettingsManager::is_list_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == SettingType::List;
}

inline void SettingsManager::clear_list(const std::string& key) {
  if(const auto* spec = find_spec(key); spec && spec->type == SettingType::List) {
    values_[spec->key] = nlohmann::json::array();
  }
}

inline bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  auto& slot = values_[spec.key];
  switch(spec.type) {
    case SettingType::Bool:
      if(value.is_boolean()) {
        slot = value;
      } else if(value.is_number_integer()) {
        slot = value.get<int>() != 0;
      } else {
        error = "expected boolean";
        return false;
      }
      return true;
    case SettingType::Int:
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      slot = value;
      return true;
    case SettingType::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      slot = value;
      return true;
    case SettingType::List:
      if(!slot.is_array()) slot = nlohmann::json::array();
      if(value.is_string()) {
        slot.push_back(value);
        return true;
      }
      if(!value.is_array() ||
         !std::all_of(value.begin(), value.end(), [](const nlohmann::json& v){ return v.is_string(); })) {
        error = "expected string or list of strings";
        return false;
      }
      for(const auto& item : value) slot.push_back(item);
      return true;
  }
  error = "unknown type";
  return false;
}

inline bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  const std::string clean = trim_copy(value);
  switch(spec->type) {
    case SettingType::Bool: {
      const auto v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return store(*spec, true, error);
      if(v == "false" || v == "0" || v == "off" || v == "no") return store(*spec, false, error);
      error = "expected boolean (true|false|on|off)";
      return false;
    }
    case SettingType::Int: {
      try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(clean, &consumed);
        if(consumed != clean.size()) {
          error = "trailing characters";
          return false;
        }
        return store(*spec, parsed, error);
      } catch(const std::exception& e) {
        error = e.what();
        return false;
      }
    }
    case SettingType::String:
    case SettingType::List:
      return store(*spec, clean, error);
  }
  error = "unknown type";
  return false;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / "srmsync.json";
}

inline bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    log_error(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    log_error(nullptr, "Settings file {} does not hold a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    // saved lists are replaced, not extended
    if(spec->type == SettingType::List) clear_list(spec->key);
    std::string error;
    if(!store(*spec, item.value(), error)) {
      log_warn(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path);
  if(!out) {
    log_error(nullptr, "Unable to write {}", path.string());
    return false;
  }
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(spec.persistent) doc[spec.key] = values_.at(spec.key);
  }
  out << doc.dump(2) << '\n';
  return true;
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}
