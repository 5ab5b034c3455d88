#pragma once

#include <memory>

#include "container_resolver.hpp"
#include "relay.hpp"
#include "resource.hpp"
#include "shell_command.hpp"

// How to stream a resource to stdout, and how many leading archive path
// components the matching load has to drop.
struct DumpResult {
  ShellCommand command;
  int strip_components = 0;
};

class CommandSynthesizer {
public:
  CommandSynthesizer(RelayShell relay, std::shared_ptr<ContainerResolver> resolver);

  // Directories are archived at their root (strip 0). `docker cp` prefixes
  // the stream with the basename of the copied path (strip 1).
  DumpResult dump(const Resource& resource) const;

  // Containers can only be loaded from a strip-0 stream; anything else is a
  // ContractViolation.
  ShellCommand load(const Resource& resource, const DumpResult& dump) const;

  // Empties the resource without removing the directory itself.
  ShellCommand remove_contents(const Resource& resource) const;

  // `mkdir -p` for every path, on one host.
  ShellCommand make_directories(const std::vector<std::string>& paths,
                                const std::optional<std::string>& host) const;

private:
  std::string container_of(const MountResource& mount) const;

  RelayShell relay_;
  std::shared_ptr<ContainerResolver> resolver_;
};
