#pragma once

#include <memory>
#include <string>

#include "log.hpp"
#include "shell_command.hpp"

struct CommandOutput {
  int exit_code = 0;
  std::string stdout_text;
};

// Seam between command synthesis and the operating system.
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  // Run with the terminal's stdin/stdout/stderr and wait for the exit code.
  virtual int run(const ShellCommand& command) = 0;

  // Run and collect stdout; stderr stays on the terminal.
  virtual CommandOutput capture(const ShellCommand& command) = 0;

  // `upstream | downstream`. Non-zero when either side fails, like pipefail.
  virtual int run_pipeline(const ShellCommand& upstream, const ShellCommand& downstream) {
    return run(ShellCommand::pipe(upstream, downstream));
  }
};

// Executes through `/bin/sh -c`. A child killed by a signal reports 128 + signo.
class ShellProcessRunner : public ProcessRunner {
public:
  explicit ShellProcessRunner(std::shared_ptr<Logger> logger = nullptr);

  int run(const ShellCommand& command) override;
  CommandOutput capture(const ShellCommand& command) override;

  // Each side gets its own shell joined by a pipe, so a failing upstream is
  // reported even when the downstream exits 0.
  int run_pipeline(const ShellCommand& upstream, const ShellCommand& downstream) override;

private:
  std::shared_ptr<Logger> logger_;
};

// Read-only queries go through; anything run() would do is only echoed.
class DryRunProcessRunner : public ProcessRunner {
public:
  DryRunProcessRunner(std::shared_ptr<ProcessRunner> inner, std::shared_ptr<Logger> logger);

  int run(const ShellCommand& command) override;
  CommandOutput capture(const ShellCommand& command) override;

private:
  std::shared_ptr<ProcessRunner> inner_;
  std::shared_ptr<Logger> logger_;
};
