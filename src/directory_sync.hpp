#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "build_strategy.hpp"

// Mirrors the pack into a directory tree. Files are rewritten only when
// their on-disk length differs from the new payload; files no longer
// produced are deleted. Equal-length content changes are not detected.
class DirectorySync : public BuildStrategy {
public:
  explicit DirectorySync(std::filesystem::path build_folder,
                         std::shared_ptr<Logger> logger = nullptr);

  BuildResult create(ResourceProvider& provider, ParallelEngine& engine) override;
  bool exists() const override { return exists_; }
  PackType type() const override { return PackType::folder; }

  // Generic relative path for location; throws std::invalid_argument when it
  // would leave the build folder.
  static std::string relative_target(const PackPath& location);

private:
  std::filesystem::path build_folder_;
  std::shared_ptr<Logger> logger_;
  bool exists_;
};
