#pragma once

#include <string>
#include <vector>

#include "errors.hpp"
#include "settings_manager.hpp"

class UsageError : public ConfigurationError {
public:
  using ConfigurationError::ConfigurationError;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "volmgr",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","source"}},
                      {{"index",1},{"key","destination"}}
                    }));

  // Throws UsageError. Positionals are required unless --help was given.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  bool is_positional_key(const std::string& key) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
