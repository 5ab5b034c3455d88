#include "volume_manager.hpp"

#include <algorithm>

#include "cancellation_window.hpp"
#include "container_resolver.hpp"
#include "errors.hpp"
#include "manifest_reader.hpp"
#include "relay.hpp"
#include "settings_manager.hpp"

namespace {

std::string join_path(const std::string& base, const std::string& name) {
  if(base.empty()) return name;
  if(base.back() == '/') return base + name;
  return base + "/" + name;
}

} // namespace

VolumeManager::VolumeManager(std::shared_ptr<ProcessRunner> runner,
                             std::shared_ptr<VolumeDiscovery> discovery,
                             std::shared_ptr<CommandSynthesizer> synthesizer,
                             Options options,
                             std::shared_ptr<Logger> logger)
  : runner_(std::move(runner)),
    discovery_(std::move(discovery)),
    synthesizer_(std::move(synthesizer)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("volmgr")) {}

std::unique_ptr<VolumeManager> VolumeManager::from_settings(const SettingsManager& settings,
                                                            std::shared_ptr<ProcessRunner> runner,
                                                            std::shared_ptr<Logger> logger) {
  RelayShell relay(settings.get<std::string>("relay_command"));

  ManifestReader::Options reader_options;
  reader_options.jsonnet_command = settings.get<std::string>("jsonnet_command");
  reader_options.jsonnet_ext_code = settings.get<std::string>("jsonnet_ext_code");
  auto reader = std::make_shared<ManifestReader>(runner, relay, reader_options);

  auto discovery = std::make_shared<VolumeDiscovery>(runner, relay, reader, logger);
  auto resolver = std::make_shared<ContainerResolver>(runner, relay,
                                                      settings.get<std::string>("container_runtime"));
  auto synthesizer = std::make_shared<CommandSynthesizer>(relay, resolver);

  Options options;
  options.volumes = settings.get<std::vector<std::string>>("volumes");
  options.delete_before_copy = settings.get<bool>("delete_before_copy");
  options.delete_pause = std::chrono::milliseconds(settings.get<int>("delete_pause_ms"));

  return std::make_unique<VolumeManager>(std::move(runner),
                                         std::move(discovery),
                                         std::move(synthesizer),
                                         std::move(options),
                                         std::move(logger));
}

void VolumeManager::check_endpoint_kinds(const std::string& source, const std::string& destination) {
  if(is_manifest(source) && is_manifest(destination)) {
    throw ConfigurationError(
      "Source and destination can't both be mounted volumes: " + source + " -> " + destination);
  }
}

std::vector<std::string> VolumeManager::select_volumes(const std::string& source,
                                                       const VolumeMap& available) const {
  if(options_.volumes.empty()) {
    return available.names();
  }
  std::vector<std::string> missing;
  for(const auto& name : options_.volumes) {
    if(!available.contains(name) &&
       std::find(missing.begin(), missing.end(), name) == missing.end()) {
      missing.push_back(name);
    }
  }
  if(!missing.empty()) {
    throw MissingVolumesError(source, std::move(missing));
  }
  return options_.volumes;
}

void VolumeManager::prepare_directory_destination(const std::string& destination,
                                                  const std::vector<std::string>& volumes) {
  if(volumes.empty()) return;
  auto qualified = split_host(destination);
  std::vector<std::string> paths;
  paths.reserve(volumes.size());
  for(const auto& volume : volumes) {
    paths.push_back(join_path(qualified.value, volume));
  }
  auto command = synthesizer_->make_directories(paths, qualified.host);
  int exit_code = runner_->run(command);
  if(exit_code != 0) {
    throw ConfigurationError("Could not create volume directories in " + destination + ": '" +
                             command.str() + "' exited with code " + std::to_string(exit_code));
  }
}

void VolumeManager::run(const std::string& source, const std::string& destination) {
  check_endpoint_kinds(source, destination);

  auto source_volumes = discovery_->discover(source);
  auto volumes = select_volumes(source, source_volumes);
  if(volumes.empty()) {
    logger_->warn("No volumes found in {}", source);
  }

  if(is_manifest(source) && !is_manifest(destination)) {
    prepare_directory_destination(destination, volumes);
  }

  auto destination_volumes = discovery_->discover(destination);
  std::vector<std::string> missing;
  for(const auto& volume : volumes) {
    if(!destination_volumes.contains(volume)) missing.push_back(volume);
  }
  if(!missing.empty()) {
    throw MissingVolumesError(destination, std::move(missing));
  }

  for(const auto& volume : volumes) {
    const auto& src = *source_volumes.find(volume);
    const auto& dest = *destination_volumes.find(volume);
    if(options_.delete_before_copy) {
      delete_volume(dest, volume);
    }
    copy_volume(src, dest, volume);
  }

  logger_->print("Copying for all volumes complete!");
}

void VolumeManager::copy_volume(const Resource& source, const Resource& destination, const std::string& volume) {
  if(is_mount(source) && is_mount(destination)) {
    throw ConfigurationError("Volume " + volume + ": container to container copies are not supported");
  }
  logger_->print("");
  logger_->print("=== {} ===", volume);
  logger_->debug("{} -> {}", describe(source), describe(destination));

  auto dump = synthesizer_->dump(source);
  auto load = synthesizer_->load(destination, dump);
  int exit_code = runner_->run_pipeline(dump.command, load);
  if(exit_code != 0) {
    throw TransferError(volume, exit_code);
  }
}

void VolumeManager::delete_volume(const Resource& resource, const std::string& volume) {
  logger_->print("Deleting destination {}...", volume);
  // resolve containers before the pause so a missing one fails early
  auto command = synthesizer_->remove_contents(resource);
  CancellationWindow(options_.delete_pause).wait();
  int exit_code = runner_->run(command);
  if(exit_code != 0) {
    throw DeleteError(volume, exit_code);
  }
}

void ensure_unprivileged(uid_t euid) {
  if(euid == 0) {
    throw PrivilegeError("Must not be run as root!");
  }
}
