#pragma once

#include <memory>
#include <optional>
#include <string>

#include "manifest_reader.hpp"
#include "process_runner.hpp"
#include "relay.hpp"
#include "resource.hpp"

constexpr const char* kVolumeDirSuffix = "-volume";

class VolumeDiscovery {
public:
  VolumeDiscovery(std::shared_ptr<ProcessRunner> runner,
                  RelayShell relay,
                  std::shared_ptr<ManifestReader> reader,
                  std::shared_ptr<Logger> logger = nullptr);

  // `[host:]manifest` or `[host:]directory`. Throws DiscoveryError; a
  // partial map is never returned.
  VolumeMap discover(const std::string& identifier) const;

  VolumeMap from_manifest(const std::string& identifier) const;
  VolumeMap from_directory(const std::string& identifier) const;

  // Mount specs naming a declared volume become MountResources; bind mounts
  // of plain paths are skipped.
  static VolumeMap mounts_from_manifest(const Manifest& manifest,
                                        const std::string& manifest_path,
                                        const std::optional<std::string>& host);

  // One directory per line, as printed by `find -type d`.
  static VolumeMap volumes_from_listing(const std::string& listing,
                                        const std::optional<std::string>& host);

private:
  std::shared_ptr<ProcessRunner> runner_;
  RelayShell relay_;
  std::shared_ptr<ManifestReader> reader_;
  std::shared_ptr<Logger> logger_;
};

// "/var/cache//" -> "/var/cache"; a bare "/" is kept.
std::string trim_trailing_separators(std::string path);
