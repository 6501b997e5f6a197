#include <cpptrace/cpptrace.hpp>

#include <filesystem>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "sync_errors.hpp"

int main(int argc, char** argv){
  CommandLineParser parser((argc > 0 && argv && argv[0])
                             ? std::filesystem::path(argv[0]).filename().string()
                             : "srmsync");
  try {
    SettingsManager settings;
    settings.load();

    try {
      parser.parse(argc, argv, settings);
    } catch(const ConfigError& e) {
      init(false);
      log_error(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("srmsync");
    logger->debug("Verbose logging enabled");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    SyncEngine engine(SyncOptions::from_settings(settings), {}, logger);
    auto summary = engine.run();
    return summary.failed == 0 ? 0 : 2;
  } catch(const SyncError& e) {
    init(false);
    Logger logger("srmsync");
    logger.error("{}", e.what());
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("srmsync");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
