#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "process_runner.hpp"
#include "relay.hpp"

struct ServiceMounts {
  std::string name;
  std::vector<std::string> volumes; // "volume:/mount/path[:mode]"
};

// The parts of a compose document volume discovery cares about.
struct Manifest {
  std::set<std::string> volumes;
  std::vector<ServiceMounts> services;
};

enum class ManifestFormat { Jsonnet, Json, Yaml };

// Manifest identifiers end in .jsonnet, .json, .yml or .yaml (any case).
std::optional<ManifestFormat> manifest_format(const std::string& path);
bool is_manifest(const std::string& identifier);

Manifest parse_json_manifest(const std::string& text);
Manifest parse_yaml_manifest(const std::string& text);

class ManifestReader {
public:
  struct Options {
    std::string jsonnet_command = "jsonnet";
    std::string jsonnet_ext_code = "useSwarm=false";
  };

  ManifestReader(std::shared_ptr<ProcessRunner> runner, RelayShell relay, Options options);

  // Fetches the manifest through the relay when host is set. Throws on a
  // failing fetch command or a document that does not parse.
  Manifest read(const std::string& path, const std::optional<std::string>& host) const;

private:
  std::string fetch(const ShellCommand& command, const std::optional<std::string>& host) const;

  std::shared_ptr<ProcessRunner> runner_;
  RelayShell relay_;
  Options options_;
};
