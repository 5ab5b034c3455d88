#include "process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr const char* kShell = "/bin/sh";

class Pipe {
public:
  Pipe() {
    if(::pipe(fds_) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe() failed");
    }
  }

  ~Pipe() {
    close_read();
    close_write();
  }

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int read_fd() const { return fds_[0]; }
  int write_fd() const { return fds_[1]; }

  void close_read() {
    if(fds_[0] >= 0) { ::close(fds_[0]); fds_[0] = -1; }
  }

  void close_write() {
    if(fds_[1] >= 0) { ::close(fds_[1]); fds_[1] = -1; }
  }

private:
  int fds_[2] = {-1, -1};
};

// Only async-signal-safe calls between fork() and exec().
[[noreturn]] void exec_shell(const std::string& text) {
  ::execl(kShell, "sh", "-c", text.c_str(), static_cast<char*>(nullptr));
  ::_exit(127);
}

int wait_for(pid_t child, const std::string& text) {
  int status = 0;
  while(::waitpid(child, &status, 0) < 0) {
    if(errno == EINTR) continue;
    throw std::system_error(errno, std::generic_category(),
                            "waitpid() on '" + text + "' failed");
  }
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}

} // namespace

ShellProcessRunner::ShellProcessRunner(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

int ShellProcessRunner::run(const ShellCommand& command) {
  log_command(logger_.get(), command.str());
  pid_t child = ::fork();
  if(child < 0) {
    throw std::system_error(errno, std::generic_category(), "fork() failed");
  }
  if(child == 0) {
    exec_shell(command.str());
  }
  return wait_for(child, command.str());
}

int ShellProcessRunner::run_pipeline(const ShellCommand& upstream, const ShellCommand& downstream) {
  const auto text = ShellCommand::pipe(upstream, downstream).str();
  log_command(logger_.get(), text);
  Pipe pipe;

  pid_t producer = ::fork();
  if(producer < 0) {
    throw std::system_error(errno, std::generic_category(), "fork() failed");
  }
  if(producer == 0) {
    ::close(pipe.read_fd());
    if(::dup2(pipe.write_fd(), STDOUT_FILENO) < 0) ::_exit(127);
    ::close(pipe.write_fd());
    exec_shell(upstream.str());
  }

  pid_t consumer = ::fork();
  if(consumer < 0) {
    int saved = errno;
    pipe.close_read();
    pipe.close_write();
    wait_for(producer, upstream.str());
    throw std::system_error(saved, std::generic_category(), "fork() failed");
  }
  if(consumer == 0) {
    ::close(pipe.write_fd());
    if(::dup2(pipe.read_fd(), STDIN_FILENO) < 0) ::_exit(127);
    ::close(pipe.read_fd());
    exec_shell(downstream.str());
  }

  // the consumer only sees EOF once every write end is closed
  pipe.close_read();
  pipe.close_write();
  int consumer_status = wait_for(consumer, downstream.str());
  int producer_status = wait_for(producer, upstream.str());
  return consumer_status != 0 ? consumer_status : producer_status;
}

CommandOutput ShellProcessRunner::capture(const ShellCommand& command) {
  log_command(logger_.get(), command.str());
  Pipe pipe;
  pid_t child = ::fork();
  if(child < 0) {
    throw std::system_error(errno, std::generic_category(), "fork() failed");
  }
  if(child == 0) {
    ::close(pipe.read_fd());
    if(::dup2(pipe.write_fd(), STDOUT_FILENO) < 0) ::_exit(127);
    ::close(pipe.write_fd());
    exec_shell(command.str());
  }

  pipe.close_write();
  CommandOutput output;
  char buffer[4096];
  for(;;) {
    ssize_t n = ::read(pipe.read_fd(), buffer, sizeof(buffer));
    if(n > 0) {
      output.stdout_text.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if(n == 0) break;
    if(errno == EINTR) continue;
    int saved = errno;
    pipe.close_read();
    wait_for(child, command.str());
    throw std::system_error(saved, std::generic_category(),
                            "reading output of '" + command.str() + "' failed");
  }
  pipe.close_read();
  output.exit_code = wait_for(child, command.str());
  return output;
}

DryRunProcessRunner::DryRunProcessRunner(std::shared_ptr<ProcessRunner> inner,
                                         std::shared_ptr<Logger> logger)
  : inner_(std::move(inner)),
    logger_(std::move(logger)) {
  if(!inner_) {
    throw std::invalid_argument("DryRunProcessRunner needs an inner runner");
  }
}

int DryRunProcessRunner::run(const ShellCommand& command) {
  log_command(logger_.get(), command.str());
  return 0;
}

CommandOutput DryRunProcessRunner::capture(const ShellCommand& command) {
  return inner_->capture(command);
}
