#pragma once

#include <optional>
#include <string>

#include "shell_command.hpp"

// Runs commands on another machine through a remote shell (`ssh -x host cmd`).
class RelayShell {
public:
  explicit RelayShell(std::string program = "ssh") : program_(std::move(program)) {}

  // Unchanged when host is empty, otherwise the whole command travels as one
  // quoted word so the remote shell parses it exactly once.
  ShellCommand wrap(const ShellCommand& command, const std::optional<std::string>& host) const;

private:
  std::string program_;
};
