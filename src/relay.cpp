#include "relay.hpp"

ShellCommand RelayShell::wrap(const ShellCommand& command, const std::optional<std::string>& host) const {
  if(!host || host->empty()) return command;
  return shell_cmd("{} -x {} {}", program_, *host, command);
}
