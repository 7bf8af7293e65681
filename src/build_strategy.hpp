#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "build_result.hpp"
#include "pack_resource.hpp"

class Logger;
class ParallelEngine;

enum class PackType {
  folder,
  zip,
  none
};

std::optional<PackType> parse_pack_type(const std::string& name);
std::string to_string(PackType type);

struct PackOptions {
  PackType type = PackType::zip;
  std::filesystem::path build_folder;
  std::filesystem::path archive_file;
  std::filesystem::path cache_directory;
};

// One way of materialising a resource set. create() throws on any
// resource or filesystem failure; nothing is returned in that case.
class BuildStrategy {
public:
  virtual ~BuildStrategy() = default;

  virtual BuildResult create(ResourceProvider& provider, ParallelEngine& engine) = 0;
  // Whether this strategy's output was present when the strategy was made.
  virtual bool exists() const = 0;
  virtual PackType type() const = 0;
};

std::unique_ptr<BuildStrategy> make_build_strategy(const PackOptions& options,
                                                   std::shared_ptr<Logger> logger = nullptr);

// Produces every resource of build into builder, in parallel. Shared by the
// strategies that keep the whole pack in memory before any side effect.
void collect_resources(PackBuild& build,
                       BuildResultBuilder& builder,
                       ParallelEngine& engine,
                       Logger& logger);
