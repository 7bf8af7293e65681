#pragma once

#include <memory>

#include "build_strategy.hpp"

// Keeps the pack in memory only. Every result is reported as changed since
// there is no earlier state to compare with.
class InMemoryBuild : public BuildStrategy {
public:
  explicit InMemoryBuild(std::shared_ptr<Logger> logger = nullptr);

  BuildResult create(ResourceProvider& provider, ParallelEngine& engine) override;
  bool exists() const override { return false; }
  PackType type() const override { return PackType::none; }

private:
  std::shared_ptr<Logger> logger_;
};
