#include "manifest_reader.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string join_mount(const std::string& source, const std::string& target) {
  return source + ":" + target;
}

// nlohmann::ordered_json keeps services in document order.
void collect_json_volume_names(const nlohmann::ordered_json& node, Manifest& manifest) {
  if(node.is_object()) {
    for(const auto& item : node.items()) manifest.volumes.insert(item.key());
  } else if(node.is_array()) {
    for(const auto& item : node) {
      if(item.is_string()) manifest.volumes.insert(item.get<std::string>());
    }
  } else if(!node.is_null()) {
    throw std::runtime_error("'volumes' must be a mapping");
  }
}

std::vector<std::string> collect_json_mounts(const nlohmann::ordered_json& service) {
  std::vector<std::string> mounts;
  if(!service.is_object() || !service.contains("volumes")) return mounts;
  const auto& entries = service.at("volumes");
  if(!entries.is_array()) {
    throw std::runtime_error("service 'volumes' must be a list");
  }
  for(const auto& entry : entries) {
    if(entry.is_string()) {
      mounts.push_back(entry.get<std::string>());
    } else if(entry.is_object() && entry.contains("source") && entry.contains("target")) {
      mounts.push_back(join_mount(entry.at("source").get<std::string>(),
                                  entry.at("target").get<std::string>()));
    }
  }
  return mounts;
}

void collect_yaml_volume_names(const YAML::Node& node, Manifest& manifest) {
  if(!node || node.IsNull()) return;
  if(node.IsMap()) {
    for(const auto& item : node) manifest.volumes.insert(item.first.as<std::string>());
  } else if(node.IsSequence()) {
    for(const auto& item : node) manifest.volumes.insert(item.as<std::string>());
  } else {
    throw std::runtime_error("'volumes' must be a mapping");
  }
}

std::vector<std::string> collect_yaml_mounts(const YAML::Node& service) {
  std::vector<std::string> mounts;
  if(!service.IsMap()) return mounts;
  const auto entries = service["volumes"];
  if(!entries || entries.IsNull()) return mounts;
  if(!entries.IsSequence()) {
    throw std::runtime_error("service 'volumes' must be a list");
  }
  for(const auto& entry : entries) {
    if(entry.IsScalar()) {
      mounts.push_back(entry.as<std::string>());
    } else if(entry.IsMap() && entry["source"] && entry["target"]) {
      mounts.push_back(join_mount(entry["source"].as<std::string>(),
                                  entry["target"].as<std::string>()));
    }
  }
  return mounts;
}

} // namespace

std::optional<ManifestFormat> manifest_format(const std::string& path) {
  auto lowered = to_lower(path);
  if(ends_with(lowered, "jsonnet")) return ManifestFormat::Jsonnet;
  if(ends_with(lowered, ".json")) return ManifestFormat::Json;
  if(ends_with(lowered, ".yml") || ends_with(lowered, ".yaml")) return ManifestFormat::Yaml;
  return std::nullopt;
}

bool is_manifest(const std::string& identifier) {
  return manifest_format(identifier).has_value();
}

Manifest parse_json_manifest(const std::string& text) {
  auto doc = nlohmann::ordered_json::parse(text);
  if(!doc.is_object()) {
    throw std::runtime_error("manifest root must be an object");
  }
  Manifest manifest;
  if(doc.contains("volumes")) {
    collect_json_volume_names(doc.at("volumes"), manifest);
  }
  if(doc.contains("services")) {
    const auto& services = doc.at("services");
    if(!services.is_object()) {
      throw std::runtime_error("'services' must be a mapping");
    }
    for(const auto& item : services.items()) {
      manifest.services.push_back(ServiceMounts{item.key(), collect_json_mounts(item.value())});
    }
  }
  return manifest;
}

Manifest parse_yaml_manifest(const std::string& text) {
  YAML::Node doc = YAML::Load(text);
  if(!doc.IsMap()) {
    throw std::runtime_error("manifest root must be a mapping");
  }
  Manifest manifest;
  collect_yaml_volume_names(doc["volumes"], manifest);
  const auto services = doc["services"];
  if(services && !services.IsNull()) {
    if(!services.IsMap()) {
      throw std::runtime_error("'services' must be a mapping");
    }
    for(const auto& item : services) {
      manifest.services.push_back(ServiceMounts{item.first.as<std::string>(),
                                                collect_yaml_mounts(item.second)});
    }
  }
  return manifest;
}

ManifestReader::ManifestReader(std::shared_ptr<ProcessRunner> runner, RelayShell relay, Options options)
  : runner_(std::move(runner)),
    relay_(std::move(relay)),
    options_(std::move(options)) {}

std::string ManifestReader::fetch(const ShellCommand& command,
                                  const std::optional<std::string>& host) const {
  auto output = runner_->capture(relay_.wrap(command, host));
  if(output.exit_code != 0) {
    throw std::runtime_error("'" + command.str() + "' exited with code " +
                             std::to_string(output.exit_code));
  }
  return output.stdout_text;
}

Manifest ManifestReader::read(const std::string& path, const std::optional<std::string>& host) const {
  auto format = manifest_format(path);
  if(!format) {
    throw std::runtime_error("unrecognised manifest type: " + path);
  }
  switch(*format) {
    case ManifestFormat::Jsonnet:
      return parse_json_manifest(fetch(shell_cmd("{} {} --ext-code {}",
                                                 options_.jsonnet_command,
                                                 path,
                                                 options_.jsonnet_ext_code),
                                       host));
    case ManifestFormat::Json:
      return parse_json_manifest(fetch(shell_cmd("cat {}", path), host));
    case ManifestFormat::Yaml:
      return parse_yaml_manifest(fetch(shell_cmd("cat {}", path), host));
  }
  throw std::logic_error("unhandled manifest format");
}
