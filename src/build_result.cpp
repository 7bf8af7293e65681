#include "build_result.hpp"

#include <stdexcept>

#include "utils.hpp"

std::string hash_entries(const PackEntries& entries) {
  Sha256Stream digest;
  digest.update_u64(entries.size());
  for(const auto& [location, bytes] : entries) {
    digest.update_u64(location.overlay.size());
    digest.update(location.overlay);
    digest.update_u64(location.path.size());
    digest.update(location.path);
    digest.update_u64(bytes.size());
    digest.update(bytes.data(), bytes.size());
  }
  return digest.hex_digest();
}

BuildResult::BuildResult(nlohmann::json meta,
                         std::optional<std::filesystem::path> target_directory,
                         PackEntries entries,
                         std::string hash,
                         bool changed)
  : meta_(std::move(meta)),
    target_directory_(std::move(target_directory)),
    entries_(std::move(entries)),
    hash_(std::move(hash)),
    changed_(changed) {}

const std::vector<char>* BuildResult::find(const PackPath& location) const {
  auto it = entries_.find(location);
  return it == entries_.end() ? nullptr : &it->second;
}

BuildResultBuilder::BuildResultBuilder(nlohmann::json meta,
                                       std::optional<std::filesystem::path> target_directory)
  : meta_(std::move(meta)),
    target_directory_(std::move(target_directory)) {}

void BuildResultBuilder::set(const PackPath& location, std::vector<char> bytes) {
  std::lock_guard lg(mutex_);
  if(frozen_) throw std::logic_error("build result is already frozen");
  auto inserted = entries_.emplace(location, std::move(bytes)).second;
  if(!inserted) {
    throw std::invalid_argument("duplicate pack entry: " + location.full_path());
  }
}

std::size_t BuildResultBuilder::size() const {
  std::lock_guard lg(mutex_);
  return entries_.size();
}

std::string BuildResultBuilder::hash() const {
  std::lock_guard lg(mutex_);
  return hash_entries(entries_);
}

BuildResult BuildResultBuilder::freeze(bool changed) {
  return freeze_by_hash([changed](const std::string&){ return changed; });
}

BuildResult BuildResultBuilder::freeze_by_hash(const std::function<bool(const std::string& hash)>& decide) {
  std::lock_guard lg(mutex_);
  if(frozen_) throw std::logic_error("build result is already frozen");
  auto hash = hash_entries(entries_);
  bool changed = decide(hash);
  frozen_ = true;
  return BuildResult(std::move(meta_), std::move(target_directory_), std::move(entries_),
                     std::move(hash), changed);
}
