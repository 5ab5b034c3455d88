#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// `host:rest` -> {host, rest}; anything without a colon stays local.
struct HostQualified {
  std::optional<std::string> host;
  std::string value;
};

HostQualified split_host(const std::string& param);

// A plain directory holding one volume's files.
struct DirectoryResource {
  std::string path;
  std::optional<std::string> relay_host;
};

// A path inside the running container of a compose service.
struct MountResource {
  std::string service_name;
  std::string mount_path;
  std::string manifest_path; // kept so the container can be resolved again later
  std::optional<std::string> relay_host;
};

using Resource = std::variant<DirectoryResource, MountResource>;

bool is_mount(const Resource& resource);
std::string describe(const Resource& resource);

// Volume name -> resource, iterated in discovery order.
class VolumeMap {
public:
  // Re-inserting a name replaces the resource but keeps its first position.
  void insert(const std::string& name, Resource resource);

  const Resource* find(const std::string& name) const;
  bool contains(const std::string& name) const { return find(name) != nullptr; }

  const std::vector<std::string>& names() const { return order_; }
  std::size_t size() const { return order_.size(); }

private:
  std::vector<std::string> order_;
  std::map<std::string, Resource> entries_;
};

// std::visit helper for exhaustive lambdas.
template<typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
