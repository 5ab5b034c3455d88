#include "resource.hpp"

#include <spdlog/fmt/fmt.h>

HostQualified split_host(const std::string& param) {
  auto pos = param.find(':');
  if(pos == std::string::npos) {
    return HostQualified{std::nullopt, param};
  }
  return HostQualified{param.substr(0, pos), param.substr(pos + 1)};
}

bool is_mount(const Resource& resource) {
  return std::holds_alternative<MountResource>(resource);
}

std::string describe(const Resource& resource) {
  auto prefix = [](const std::optional<std::string>& host) {
    return host ? *host + ":" : std::string();
  };
  return std::visit(overloaded{
    [&](const DirectoryResource& dir) {
      return fmt::format("directory {}{}", prefix(dir.relay_host), dir.path);
    },
    [&](const MountResource& mount) {
      return fmt::format("{}{} of service {} ({})",
                         prefix(mount.relay_host), mount.mount_path,
                         mount.service_name, mount.manifest_path);
    }
  }, resource);
}

void VolumeMap::insert(const std::string& name, Resource resource) {
  auto it = entries_.find(name);
  if(it != entries_.end()) {
    it->second = std::move(resource);
    return;
  }
  order_.push_back(name);
  entries_.emplace(name, std::move(resource));
}

const Resource* VolumeMap::find(const std::string& name) const {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}
