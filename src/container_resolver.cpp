#include "container_resolver.hpp"

#include <regex>
#include <sstream>

#include "errors.hpp"

namespace {

constexpr std::size_t kShortIdLength = 12;

bool is_letter(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool is_lower(char ch) {
  return ch >= 'a' && ch <= 'z';
}

bool boundary_before(const std::string& name, std::size_t pos) {
  return pos == 0 || !is_letter(name[pos - 1]);
}

bool boundary_after(const std::string& name, std::size_t end) {
  if(end >= name.size()) return true;
  if(is_letter(name[end])) return false;
  if(name[end] == '-' && end + 1 < name.size() && is_lower(name[end + 1])) return false;
  return true;
}

} // namespace

std::vector<ContainerListing> parse_container_listing(const std::string& text) {
  static const std::regex id_column("^([a-f0-9]{12})(?=\\s|$)");
  std::vector<ContainerListing> rows;
  std::istringstream lines(text);
  std::string line;
  while(std::getline(lines, line)) {
    std::smatch match;
    if(!std::regex_search(line, match, id_column)) continue;

    std::istringstream fields(line.substr(kShortIdLength));
    std::string field;
    std::string name;
    while(fields >> field) name = field;
    rows.push_back(ContainerListing{match[1].str(), name.empty() ? match[1].str() : name});
  }
  return rows;
}

bool container_name_matches(const std::string& container_name, const std::string& service_name) {
  if(service_name.empty()) return false;
  for(auto pos = container_name.find(service_name);
      pos != std::string::npos;
      pos = container_name.find(service_name, pos + 1)) {
    if(boundary_before(container_name, pos) &&
       boundary_after(container_name, pos + service_name.size())) {
      return true;
    }
  }
  return false;
}

ContainerResolver::ContainerResolver(std::shared_ptr<ProcessRunner> runner,
                                     RelayShell relay,
                                     std::string runtime)
  : runner_(std::move(runner)),
    relay_(std::move(relay)),
    runtime_(std::move(runtime)) {}

std::string ContainerResolver::resolve(const std::string& service_name,
                                       const std::string& /*manifest_path*/,
                                       const std::optional<std::string>& host) const {
  auto listing = relay_.wrap(shell_cmd("{} ps", runtime_), host);
  auto output = runner_->capture(listing);
  if(output.exit_code != 0) {
    throw DiscoveryError(host ? "running containers on " + *host : "running containers",
                         "'" + listing.str() + "' exited with code " +
                         std::to_string(output.exit_code));
  }
  for(const auto& row : parse_container_listing(output.stdout_text)) {
    if(container_name_matches(row.name, service_name)) {
      return row.id;
    }
  }
  throw ContainerNotFoundError(service_name);
}
