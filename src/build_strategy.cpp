#include "build_strategy.hpp"

#include <stdexcept>

#include "archive_writer.hpp"
#include "directory_sync.hpp"
#include "in_memory_build.hpp"
#include "log.hpp"
#include "parallel_engine.hpp"
#include "utils.hpp"

std::optional<PackType> parse_pack_type(const std::string& name) {
  auto lowered = to_lower_copy(name);
  if(lowered == "folder") return PackType::folder;
  if(lowered == "zip") return PackType::zip;
  if(lowered == "none") return PackType::none;
  return std::nullopt;
}

std::string to_string(PackType type) {
  switch(type) {
    case PackType::folder: return "folder";
    case PackType::zip: return "zip";
    case PackType::none: return "none";
  }
  return "unknown";
}

std::unique_ptr<BuildStrategy> make_build_strategy(const PackOptions& options,
                                                   std::shared_ptr<Logger> logger) {
  switch(options.type) {
    case PackType::folder:
      return std::make_unique<DirectorySync>(options.build_folder, std::move(logger));
    case PackType::zip:
      return std::make_unique<ArchiveWriter>(options.archive_file, options.cache_directory, std::move(logger));
    case PackType::none:
      return std::make_unique<InMemoryBuild>(std::move(logger));
  }
  throw std::invalid_argument("unknown pack type");
}

void collect_resources(PackBuild& build,
                       BuildResultBuilder& builder,
                       ParallelEngine& engine,
                       Logger& logger) {
  for_each_parallel(engine, build.resources,
    [](const std::unique_ptr<PackResource>& resource){ return resource->estimated_size(); },
    [&](std::unique_ptr<PackResource>& resource){
      builder.set(resource->location(), resource->bytes());
      auto index = engine.progress();
      logger.progress("zipped", resource->location().full_path(), index, engine.goal());
    });
}
