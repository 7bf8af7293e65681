#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "build_strategy.hpp"
#include "change_detector.hpp"

// Writes the pack as a single ZIP archive, but only when the whole-pack hash
// differs from the one recorded by the previous build.
class ArchiveWriter : public BuildStrategy {
public:
  static constexpr const char* kArchiveComment = "packgen generated resource pack.";

  ArchiveWriter(std::filesystem::path archive_file,
                std::filesystem::path cache_directory,
                std::shared_ptr<Logger> logger = nullptr);

  BuildResult create(ResourceProvider& provider, ParallelEngine& engine) override;
  bool exists() const override { return exists_; }
  PackType type() const override { return PackType::zip; }

private:
  void write_archive(const BuildResult& result);

  std::filesystem::path archive_file_;
  std::shared_ptr<Logger> logger_;
  ChangeDetector detector_;
  bool exists_;
};
