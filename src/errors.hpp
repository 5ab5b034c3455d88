#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Every failure the tool reports to the operator derives from VolumeError;
// anything else escaping main is a bug and gets a stack trace.
class VolumeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class DiscoveryError : public VolumeError {
public:
  DiscoveryError(std::string identifier, const std::string& cause)
    : VolumeError("Unable to discover volumes in " + identifier + ": " + cause),
      identifier_(std::move(identifier)) {}

  const std::string& identifier() const { return identifier_; }

private:
  std::string identifier_;
};

class ContainerNotFoundError : public VolumeError {
public:
  explicit ContainerNotFoundError(std::string service_name)
    : VolumeError("Could not find running container for " + service_name),
      service_name_(std::move(service_name)) {}

  const std::string& service_name() const { return service_name_; }

private:
  std::string service_name_;
};

class ConfigurationError : public VolumeError {
public:
  using VolumeError::VolumeError;
};

class MissingVolumesError : public ConfigurationError {
public:
  MissingVolumesError(std::string identifier, std::vector<std::string> names)
    : ConfigurationError(describe(identifier, names)),
      identifier_(std::move(identifier)),
      names_(std::move(names)) {}

  const std::string& identifier() const { return identifier_; }
  const std::vector<std::string>& names() const { return names_; }

private:
  static std::string describe(const std::string& identifier,
                              const std::vector<std::string>& names) {
    std::string joined;
    for(const auto& name : names) {
      if(!joined.empty()) joined += ", ";
      joined += name;
    }
    return "The following volumes weren't found in " + identifier + ": " + joined;
  }

  std::string identifier_;
  std::vector<std::string> names_;
};

class TransferError : public VolumeError {
public:
  TransferError(std::string volume, int exit_code)
    : VolumeError("Copying volume " + volume + " failed with exit code " + std::to_string(exit_code)),
      volume_(std::move(volume)),
      exit_code_(exit_code) {}

  const std::string& volume() const { return volume_; }
  int exit_code() const { return exit_code_; }

private:
  std::string volume_;
  int exit_code_;
};

class DeleteError : public VolumeError {
public:
  DeleteError(std::string volume, int exit_code)
    : VolumeError("Deleting volume " + volume + " failed with exit code " + std::to_string(exit_code)),
      volume_(std::move(volume)),
      exit_code_(exit_code) {}

  const std::string& volume() const { return volume_; }
  int exit_code() const { return exit_code_; }

private:
  std::string volume_;
  int exit_code_;
};

// Broken internal invariant, not an operator mistake.
class ContractViolation : public VolumeError {
public:
  using VolumeError::VolumeError;
};

class InterruptedError : public VolumeError {
public:
  explicit InterruptedError(int signal_number)
    : VolumeError("Interrupted by signal " + std::to_string(signal_number)),
      signal_number_(signal_number) {}

  int signal_number() const { return signal_number_; }

private:
  int signal_number_;
};

class PrivilegeError : public VolumeError {
public:
  using VolumeError::VolumeError;
};
