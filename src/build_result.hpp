#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pack_resource.hpp"

using PackEntries = std::map<PackPath, std::vector<char>>;

std::string hash_entries(const PackEntries& entries);

// A finished build. Immutable: the changed flag is fixed when the result is
// produced by BuildResultBuilder::freeze.
class BuildResult {
public:
  const nlohmann::json& meta() const { return meta_; }
  const std::optional<std::filesystem::path>& target_directory() const { return target_directory_; }

  // Sorted by (overlay, path).
  const PackEntries& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  const std::vector<char>* find(const PackPath& location) const;

  const std::string& hash() const { return hash_; }
  bool changed() const { return changed_; }

private:
  friend class BuildResultBuilder;
  BuildResult(nlohmann::json meta,
              std::optional<std::filesystem::path> target_directory,
              PackEntries entries,
              std::string hash,
              bool changed);

  nlohmann::json meta_;
  std::optional<std::filesystem::path> target_directory_;
  PackEntries entries_;
  std::string hash_;
  bool changed_;
};

// Collects entries from parallel producers.
class BuildResultBuilder {
public:
  explicit BuildResultBuilder(nlohmann::json meta,
                              std::optional<std::filesystem::path> target_directory = std::nullopt);

  // Throws std::invalid_argument if the location was already set.
  void set(const PackPath& location, std::vector<char> bytes);

  std::size_t size() const;
  std::string hash() const;

  BuildResult freeze(bool changed);
  // Hashes once and lets decide() pick the changed flag from that hash.
  BuildResult freeze_by_hash(const std::function<bool(const std::string& hash)>& decide);

private:
  mutable std::mutex mutex_;
  nlohmann::json meta_;
  std::optional<std::filesystem::path> target_directory_;
  PackEntries entries_;
  bool frozen_ = false;
};
