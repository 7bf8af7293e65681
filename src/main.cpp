#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <stdexcept>

#include "build_strategy.hpp"
#include "command_line_parser.hpp"
#include "directory_resource_provider.hpp"
#include "log.hpp"
#include "parallel_engine.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "packgen");
    try {
      parser.parse(argc, argv, settings);
    } catch(const std::invalid_argument& e) {
      print_err("{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    Logger logger("packgen");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger.error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    int worker_threads = settings.get<int>("worker_threads");
    if(worker_threads < 0) {
      logger.error("Invalid worker_threads '{}'", worker_threads);
      return 1;
    }

    auto options = pack_options_from_settings(settings);
    DirectoryResourceProvider provider(settings.get<std::string>("source"),
                                       settings.get<bool>("use_obfuscation"));
    ThreadPoolEngine engine(static_cast<std::size_t>(worker_threads));
    auto strategy = make_build_strategy(options);
    logger.debug("Building {} pack with {} threads", to_string(strategy->type()), engine.thread_count());

    auto result = strategy->create(provider, engine);
    logger.print("{} ({} resources, hash {})",
                 result.changed() ? "changed" : "unchanged",
                 result.size(),
                 result.hash());
    return 0;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("packgen-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
