#pragma once

#include "log.hpp"
#include "process_runner.hpp"
#include "shell_command.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace volmgr::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

// Scripted stand-in for the shell. Responses are matched by substring in
// registration order; unmatched commands succeed with empty output.
class RecordingRunner : public ProcessRunner {
public:
  struct Call {
    bool captured = false;
    bool piped = false;
    std::string command;
  };

  void respond(std::string needle, CommandOutput output) {
    responses_.push_back({std::move(needle), std::move(output)});
  }

  void respond(std::string needle, int exit_code, std::string stdout_text = std::string()) {
    respond(std::move(needle), CommandOutput{exit_code, std::move(stdout_text)});
  }

  int run(const ShellCommand& command) override {
    calls_.push_back({false, false, command.str()});
    return lookup(command.str()).exit_code;
  }

  CommandOutput capture(const ShellCommand& command) override {
    calls_.push_back({true, false, command.str()});
    return lookup(command.str());
  }

  int run_pipeline(const ShellCommand& upstream, const ShellCommand& downstream) override {
    auto text = ShellCommand::pipe(upstream, downstream).str();
    calls_.push_back({false, true, text});
    return lookup(text).exit_code;
  }

  const std::vector<Call>& calls() const { return calls_; }

  std::vector<std::string> run_commands() const {
    std::vector<std::string> out;
    for(const auto& call : calls_) {
      if(!call.captured) out.push_back(call.command);
    }
    return out;
  }

  // Index of the first call containing needle, or -1.
  long index_of(const std::string& needle) const {
    for(std::size_t i = 0; i < calls_.size(); ++i) {
      if(calls_[i].command.find(needle) != std::string::npos) return static_cast<long>(i);
    }
    return -1;
  }

private:
  CommandOutput lookup(const std::string& command) const {
    for(const auto& response : responses_) {
      if(command.find(response.first) != std::string::npos) return response.second;
    }
    return CommandOutput{};
  }

  std::vector<std::pair<std::string, CommandOutput>> responses_;
  std::vector<Call> calls_;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& label) {
    static std::atomic<unsigned> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("volmgr_test_" + label + "_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter++));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path make_dir(const std::string& relative) const {
    auto dir = path_ / relative;
    std::filesystem::create_directories(dir);
    return dir;
  }

  void write_file(const std::string& relative, const std::string& content) const {
    auto file = path_ / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::trunc);
    if(!out) throw std::runtime_error("cannot write " + file.string());
    out << content;
  }

private:
  std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace volmgr::test
