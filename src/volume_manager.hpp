#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

#include "command_synthesis.hpp"
#include "discovery.hpp"
#include "log.hpp"
#include "process_runner.hpp"
#include "resource.hpp"

class SettingsManager;

class VolumeManager {
public:
  struct Options {
    std::vector<std::string> volumes; // empty = everything the source has
    bool delete_before_copy = false;
    std::chrono::milliseconds delete_pause{500};
  };

  VolumeManager(std::shared_ptr<ProcessRunner> runner,
                std::shared_ptr<VolumeDiscovery> discovery,
                std::shared_ptr<CommandSynthesizer> synthesizer,
                Options options,
                std::shared_ptr<Logger> logger = nullptr);

  // Wires discovery, container resolution and synthesis from settings
  // (relay_command, container_runtime, jsonnet_*, volumes, delete_*).
  static std::unique_ptr<VolumeManager> from_settings(const SettingsManager& settings,
                                                      std::shared_ptr<ProcessRunner> runner,
                                                      std::shared_ptr<Logger> logger);

  // Whole run: preflight checks, discovery of both sides, then each volume
  // in turn (optional delete, then copy). Stops at the first failure.
  void run(const std::string& source, const std::string& destination);

  // dump | load as one pipeline; fails if either side does. Throws TransferError.
  void copy_volume(const Resource& source, const Resource& destination, const std::string& volume);

  // Empties the resource after the cancellation pause. Throws DeleteError.
  void delete_volume(const Resource& resource, const std::string& volume);

  // Container to container has no streaming path; rejected before any work.
  static void check_endpoint_kinds(const std::string& source, const std::string& destination);

private:
  std::vector<std::string> select_volumes(const std::string& source, const VolumeMap& available) const;
  void prepare_directory_destination(const std::string& destination,
                                     const std::vector<std::string>& volumes);

  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<VolumeDiscovery> discovery_;
  std::shared_ptr<CommandSynthesizer> synthesizer_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};

// Refuses an effective uid of 0. Throws PrivilegeError.
void ensure_unprivileged(uid_t euid = ::geteuid());
