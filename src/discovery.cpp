#include "discovery.hpp"

#include <sstream>

#include "errors.hpp"

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string basename_of(const std::string& path) {
  auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

// "/srv/data:ro" -> "/srv/data"
std::string strip_mount_mode(const std::string& target) {
  auto pos = target.find(':');
  return pos == std::string::npos ? target : target.substr(0, pos);
}

} // namespace

std::string trim_trailing_separators(std::string path) {
  while(path.size() > 1 && path.back() == '/') path.pop_back();
  return path;
}

VolumeDiscovery::VolumeDiscovery(std::shared_ptr<ProcessRunner> runner,
                                 RelayShell relay,
                                 std::shared_ptr<ManifestReader> reader,
                                 std::shared_ptr<Logger> logger)
  : runner_(std::move(runner)),
    relay_(std::move(relay)),
    reader_(std::move(reader)),
    logger_(std::move(logger)) {}

VolumeMap VolumeDiscovery::discover(const std::string& identifier) const {
  return is_manifest(identifier) ? from_manifest(identifier) : from_directory(identifier);
}

VolumeMap VolumeDiscovery::from_manifest(const std::string& identifier) const {
  auto qualified = split_host(identifier);
  Manifest manifest;
  try {
    manifest = reader_->read(qualified.value, qualified.host);
  } catch(const std::exception& e) {
    throw DiscoveryError(identifier, e.what());
  }
  auto volumes = mounts_from_manifest(manifest, qualified.value, qualified.host);
  log_debug(logger_.get(), "{}: {} mounted volume(s)", identifier, volumes.size());
  return volumes;
}

VolumeMap VolumeDiscovery::from_directory(const std::string& identifier) const {
  auto qualified = split_host(identifier);
  auto listing = shell_cmd("find {} -mindepth 1 -maxdepth 1 -type d", qualified.value);
  CommandOutput output;
  try {
    output = runner_->capture(relay_.wrap(listing, qualified.host));
  } catch(const std::exception& e) {
    throw DiscoveryError(identifier, e.what());
  }
  if(output.exit_code != 0) {
    throw DiscoveryError(identifier, "'" + listing.str() + "' exited with code " +
                                     std::to_string(output.exit_code));
  }
  auto volumes = volumes_from_listing(output.stdout_text, qualified.host);
  log_debug(logger_.get(), "{}: {} volume directories", identifier, volumes.size());
  return volumes;
}

VolumeMap VolumeDiscovery::mounts_from_manifest(const Manifest& manifest,
                                                const std::string& manifest_path,
                                                const std::optional<std::string>& host) {
  VolumeMap volumes;
  for(const auto& service : manifest.services) {
    for(const auto& line : service.volumes) {
      auto pos = line.find(':');
      if(pos == std::string::npos) continue;
      auto volume_name = line.substr(0, pos);
      if(manifest.volumes.count(volume_name) == 0) continue;
      auto mount_path = trim_trailing_separators(strip_mount_mode(line.substr(pos + 1)));
      volumes.insert(volume_name, MountResource{service.name, mount_path, manifest_path, host});
    }
  }
  return volumes;
}

VolumeMap VolumeDiscovery::volumes_from_listing(const std::string& listing,
                                                const std::optional<std::string>& host) {
  VolumeMap volumes;
  std::istringstream lines(listing);
  std::string raw;
  while(std::getline(lines, raw)) {
    if(!raw.empty() && raw.back() == '\r') raw.pop_back();
    auto path = trim_trailing_separators(raw);
    if(!ends_with(path, kVolumeDirSuffix)) continue;
    volumes.insert(basename_of(path), DirectoryResource{path, host});
  }
  return volumes;
}
