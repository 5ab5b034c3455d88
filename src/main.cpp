#include <cpptrace/cpptrace.hpp>

#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "process_runner.hpp"
#include "settings_manager.hpp"
#include "volume_manager.hpp"

int main(int argc, char** argv){
  CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "volmgr");
  try {
    SettingsManager settings;
    settings.load();
    parser.parse(argc, argv, settings);
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>();

    if(!settings.get<bool>("allow_root")) {
      ensure_unprivileged();
    }

    std::shared_ptr<ProcessRunner> runner = std::make_shared<ShellProcessRunner>(logger);
    if(settings.get<bool>("dry_run")) {
      set_echo_commands(true);
      runner = std::make_shared<DryRunProcessRunner>(runner, logger);
    }

    auto manager = VolumeManager::from_settings(settings, runner, logger);
    manager->run(settings.get<std::string>("source"), settings.get<std::string>("destination"));
    return 0;
  } catch(const UsageError& e) {
    init(false);
    print_err(nullptr, "error: {}", e.what());
    parser.usage();
    return 2;
  } catch(const VolumeError& e) {
    init(false);
    Logger logger("volmgr");
    logger.error("{}", e.what());
    return 1;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("volmgr");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
