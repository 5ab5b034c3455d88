#include "command_synthesis.hpp"

#include "errors.hpp"

namespace {

constexpr int kDirectoryStrip = 0;
constexpr int kContainerCopyStrip = 1;

} // namespace

CommandSynthesizer::CommandSynthesizer(RelayShell relay, std::shared_ptr<ContainerResolver> resolver)
  : relay_(std::move(relay)),
    resolver_(std::move(resolver)) {}

std::string CommandSynthesizer::container_of(const MountResource& mount) const {
  return resolver_->resolve(mount.service_name, mount.manifest_path, mount.relay_host);
}

DumpResult CommandSynthesizer::dump(const Resource& resource) const {
  return std::visit(overloaded{
    [&](const DirectoryResource& dir) {
      return DumpResult{
        relay_.wrap(shell_cmd("tar -c -C {} .", dir.path), dir.relay_host),
        kDirectoryStrip
      };
    },
    [&](const MountResource& mount) {
      return DumpResult{
        relay_.wrap(shell_cmd("{runtime} cp {container}:{path} -",
                              shell_arg("runtime", resolver_->runtime()),
                              shell_arg("container", container_of(mount)),
                              shell_arg("path", mount.mount_path)),
                    mount.relay_host),
        kContainerCopyStrip
      };
    }
  }, resource);
}

ShellCommand CommandSynthesizer::load(const Resource& resource, const DumpResult& dump) const {
  return std::visit(overloaded{
    [&](const DirectoryResource& dir) {
      return relay_.wrap(shell_cmd("tar xvf - --strip-components={strip} -C {path}",
                                   shell_arg("strip", dump.strip_components),
                                   shell_arg("path", dir.path)),
                         dir.relay_host);
    },
    [&](const MountResource& mount) {
      if(dump.strip_components != kDirectoryStrip) {
        throw ContractViolation(
          "cannot load a stream with strip-components=" +
          std::to_string(dump.strip_components) + " into container path " +
          mount.mount_path + " of service " + mount.service_name +
          "; container to container transfers are not supported");
      }
      return relay_.wrap(shell_cmd("{runtime} cp - {container}:{path}",
                                   shell_arg("runtime", resolver_->runtime()),
                                   shell_arg("container", container_of(mount)),
                                   shell_arg("path", mount.mount_path)),
                         mount.relay_host);
    }
  }, resource);
}

ShellCommand CommandSynthesizer::remove_contents(const Resource& resource) const {
  return std::visit(overloaded{
    [&](const DirectoryResource& dir) {
      return relay_.wrap(shell_cmd("rm -rvf {}/*", dir.path), dir.relay_host);
    },
    [&](const MountResource& mount) {
      auto inside = shell_cmd("rm -rvf {}/*", mount.mount_path);
      return relay_.wrap(shell_cmd("{runtime} exec {container} /bin/sh -c {command}",
                                   shell_arg("runtime", resolver_->runtime()),
                                   shell_arg("container", container_of(mount)),
                                   shell_arg("command", inside)),
                         mount.relay_host);
    }
  }, resource);
}

ShellCommand CommandSynthesizer::make_directories(const std::vector<std::string>& paths,
                                                  const std::optional<std::string>& host) const {
  return relay_.wrap(ShellCommand::literal("mkdir -p").with_args(paths), host);
}
