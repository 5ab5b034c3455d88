#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::logic_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_positional_key(const std::string& key) const {
  return std::any_of(positional_specs_.begin(), positional_specs_.end(),
                     [&](const ArgvSpec& spec){ return spec.key == key; });
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  auto fail = [](const std::string& message){
    throw UsageError(message);
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](std::string key_token, bool long_form){
      std::optional<std::string> inline_value;
      if(long_form) {
        auto eq = key_token.find('=');
        if(eq != std::string::npos) {
          inline_value = key_token.substr(eq + 1);
          key_token.erase(eq);
        }
      }
      auto resolved = settings.resolve_key(key_token);
      if(!resolved || is_positional_key(*resolved)) {
        if(long_form) {
          fail("Unknown option --" + key_token);
        }
        return false; // treat as positional for short tokens
      }

      std::string error;
      if(inline_value) {
        if(!settings.set_from_string(*resolved, *inline_value, error)) {
          fail("Invalid value for option '" + key_token + "': " + error);
        }
        return true;
      }

      if(settings.is_list_setting(*resolved)) {
        nlohmann::json items = nlohmann::json::array();
        while(i + 1 < args.size() && !is_option_token(args[i + 1])) {
          items.push_back(args[++i]);
        }
        if(items.empty()) {
          fail("Option '" + key_token + "' expects at least one value");
        }
        if(!settings.set_from_json(*resolved, items, error)) {
          fail("Invalid value for option '" + key_token + "': " + error);
        }
        return true;
      }

      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          fail("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      if(!settings.set_from_string(*resolved, value, error)) {
        fail("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token == "--") {
      continue;
    }

    if(token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-') {
      if(handle_option(token.substr(1), false)) {
        continue;
      }
      // fall through to positional if alias unrecognised
    }

    if(positional_index >= positional_specs_.size()) {
      fail("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      fail("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }

  if(settings.help_requested()) return;
  if(positional_index < positional_specs_.size()) {
    fail("Missing required argument <" + positional_specs_[positional_index].key + ">");
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - copy docker volume data between running containers and directories, across ssh",
            process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " <" + pos.key + ">";
  }
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Endpoints are a docker-compose.yml/.json or .jsonnet manifest, or a directory");
  print_out(nullptr, "whose *-volume subdirectories are the volumes. Prefix with 'host:' to reach");
  print_out(nullptr, "them over ssh, e.g. foo-machine:/home/foo/project/.env.prod.jsonnet");
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    if(is_positional_key(key)) continue;
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint;
    if(type == "bool") {
      argument_hint = "";
    } else if(type == "list") {
      argument_hint = "NAME...";
    } else {
      argument_hint = "<" + type + ">";
    }
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    std::string flag = key;
    std::replace(flag.begin(), flag.end(), '_', '-');
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(nullptr, "  --{:<20} {:<8} {}{} (default: {})",
              flag,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
