#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source"},              {"aliases", {"src"}},             {"type","string"}, {"default",""},        {"description","[host:]manifest or [host:]directory to copy from"}, {"persistent", false}},
  {{"key","destination"},         {"aliases", {"dest"}},            {"type","string"}, {"default",""},        {"description","[host:]manifest or [host:]directory to copy to"}, {"persistent", false}},
  {{"key","volumes"},             {"aliases", {"v"}},               {"type","list"},   {"default",nlohmann::json::array()}, {"description","Volumes to copy (default: all found in the source)"}, {"persistent", false}},
  {{"key","delete_before_copy"},  {"aliases", {"delete"}},          {"type","bool"},   {"default",false},     {"description","Delete files in the destination before copying"}, {"persistent", false}},
  {{"key","delete_pause_ms"},     {"aliases", {"pause"}},           {"type","int"},    {"default",500},       {"description","Milliseconds to wait for ctrl+c before deleting"}, {"persistent", true}},
  {{"key","relay_command"},       {"aliases", {"ssh"}},             {"type","string"}, {"default","ssh"},     {"description","Remote shell used for host:path endpoints"}, {"persistent", true}},
  {{"key","container_runtime"},   {"aliases", {"runtime"}},         {"type","string"}, {"default","docker"},  {"description","Container runtime command"}, {"persistent", true}},
  {{"key","jsonnet_command"},     {"aliases", {"jsonnet"}},         {"type","string"}, {"default","jsonnet"}, {"description","Evaluator for .jsonnet manifests"}, {"persistent", true}},
  {{"key","jsonnet_ext_code"},    {"aliases", {"ext_code"}},        {"type","string"}, {"default","useSwarm=false"}, {"description","--ext-code passed to the jsonnet evaluator"}, {"persistent", true}},
  {{"key","dry_run"},             {"aliases", {"n"}},               {"type","bool"},   {"default",false},     {"description","Print copy and delete commands instead of running them"}, {"persistent", false}},
  {{"key","verbose"},             {"aliases", nlohmann::json::array()},{"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","allow_root"},          {"aliases", nlohmann::json::array()},{"type","bool"},   {"default",false},     {"description","Run even with an effective uid of 0"}, {"persistent", false}},
  {{"key","help"},                {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // A missing file is fine; an unreadable one is reported and ignored.
  bool load();
  bool load_from_file(const std::filesystem::path& path);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  bool is_list_setting(const std::string& key) const;

  // $XDG_CONFIG_HOME/volmgr/settings.json, else ~/.config/volmgr/settings.json
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  // Lower case with '-' folded to '_', so --delete-before-copy finds delete_before_copy.
  static std::string normalize_key(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::normalize_key(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::normalize_key(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string normalized = normalize_key(token);
  for(const auto& spec : setting_specs_) {
    if(normalized == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), normalized) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "volmgr" / "settings.json";
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "volmgr" / "settings.json";
  }
  return {};
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
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
    log_warn(nullptr, "Ignoring unreadable settings file {}: {}", path.string(), e.what());
    return false;
  }
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    if(!spec->persistent) {
      log_warn(nullptr, "Setting '{}' can only be given on the command line", spec->key);
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      log_warn(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
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
  if(spec.type == "list") {
    if(value.is_array() &&
       std::all_of(value.begin(), value.end(), [](const nlohmann::json& item){ return item.is_string(); })) {
      settings_[spec.key] = value;
      return true;
    }
    error = "expected list of strings";
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
  if(spec.type == "list") {
    // "a,b c" -> ["a", "b", "c"]
    nlohmann::json items = nlohmann::json::array();
    std::string item;
    std::istringstream in(clean);
    while(in >> item) {
      std::istringstream parts(item);
      std::string part;
      while(std::getline(parts, part, ',')) {
        if(!part.empty()) items.push_back(part);
      }
    }
    return items;
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

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::normalize_key(std::string value) {
  value = to_lower(std::move(value));
  std::replace(value.begin(), value.end(), '-', '_');
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
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

inline bool SettingsManager::is_list_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "list";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
