#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "process_runner.hpp"
#include "relay.hpp"

struct ContainerListing {
  std::string id;   // 12 hex digits
  std::string name; // last column of `docker ps`
};

// Rows of `docker ps` whose first column is a short container id; headers
// and wrapped lines are dropped.
std::vector<ContainerListing> parse_container_listing(const std::string& text);

// Compose names containers `<project>_<service>_<n>` or `<project>-<service>-<n>`.
// The service must appear with no letter before it, and neither a letter nor
// `-<lowercase>` after it, so "web" matches "app_web_1" and "web-1" but not
// "webapp" or "web-api".
bool container_name_matches(const std::string& container_name, const std::string& service_name);

class ContainerResolver {
public:
  ContainerResolver(std::shared_ptr<ProcessRunner> runner,
                    RelayShell relay,
                    std::string runtime = "docker");

  // First running container, in listing order, that belongs to the service.
  // The listing is not scoped to the manifest's compose project.
  // Throws ContainerNotFoundError; there is no waiting for one to appear.
  std::string resolve(const std::string& service_name,
                      const std::string& manifest_path,
                      const std::optional<std::string>& host) const;

  const std::string& runtime() const { return runtime_; }

private:
  std::shared_ptr<ProcessRunner> runner_;
  RelayShell relay_;
  std::string runtime_;
};
