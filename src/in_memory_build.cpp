#include "in_memory_build.hpp"

#include "log.hpp"
#include "parallel_engine.hpp"

InMemoryBuild::InMemoryBuild(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("pack-none")) {}

BuildResult InMemoryBuild::create(ResourceProvider& provider, ParallelEngine& engine) {
  auto build = provider.build_resources();
  BuildResultBuilder builder(std::move(build.meta));
  collect_resources(build, builder, engine, *logger_);
  auto result = builder.freeze(true);
  logger_->info("Built {} resources in memory", result.size());
  return result;
}
