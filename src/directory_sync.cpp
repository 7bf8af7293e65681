#include "directory_sync.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

#include "directory_index.hpp"
#include "log.hpp"
#include "parallel_engine.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

void ensure_parent(const fs::path& file) {
  if(!file.has_parent_path()) return;
  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  // Another worker may have created it in the meantime.
  if(ec && !fs::is_directory(file.parent_path())) {
    throw std::runtime_error("Unable to create " + file.parent_path().string() + ": " + ec.message());
  }
}

} // namespace

DirectorySync::DirectorySync(fs::path build_folder, std::shared_ptr<Logger> logger)
  : build_folder_(std::move(build_folder)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("pack-folder")),
    exists_(fs::exists(build_folder_)) {}

std::string DirectorySync::relative_target(const PackPath& location) {
  auto full = location.full_path();
  fs::path relative = fs::path(full).lexically_normal();
  if(full.empty() || relative.empty() || relative.is_absolute() || relative.has_root_name()) {
    throw std::invalid_argument("invalid pack path '" + full + "'");
  }
  auto first = *relative.begin();
  if(first == ".." || first == ".") {
    throw std::invalid_argument("pack path '" + full + "' leaves the build folder");
  }
  return relative.generic_string();
}

BuildResult DirectorySync::create(ResourceProvider& provider, ParallelEngine& engine) {
  auto build = provider.build_resources();
  DirectoryIndex index(build_folder_);
  BuildResultBuilder builder(std::move(build.meta), build_folder_);
  std::atomic<bool> changed{false};
  std::mutex targets_mutex;
  std::unordered_set<std::string> targets;

  for_each_parallel(engine, build.resources,
    [](const std::unique_ptr<PackResource>& resource){ return resource->estimated_size(); },
    [&](std::unique_ptr<PackResource>& resource){
      const auto& bytes = resource->bytes();
      auto relative = relative_target(resource->location());
      builder.set(resource->location(), bytes);
      {
        std::lock_guard lg(targets_mutex);
        if(!targets.insert(relative).second) {
          throw std::invalid_argument("pack path " + resource->location().full_path() +
                                      " collides with another resource at " + relative);
        }
      }

      fs::path file;
      if(auto claimed = index.claim(relative)) {
        file = std::move(*claimed);
      } else {
        file = build_folder_ / fs::path(relative);
        ensure_parent(file);
      }

      std::error_code ec;
      bool present = fs::is_regular_file(file, ec);
      auto on_disk = present ? fs::file_size(file, ec) : 0;
      auto index_value = engine.progress();
      if(!present || ec || on_disk != bytes.size()) {
        write_file_bytes(file, bytes);
        changed.store(true, std::memory_order_release);
        logger_->progress("generated", relative, index_value, engine.goal());
      }
    });

  std::size_t removed = 0;
  for(const auto& [relative, path] : index.take_remaining()) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if(ec) continue;
    if(fs::is_directory(status)) {
      // Children sort first, so emptied directories are already empty here.
      if(fs::is_empty(path, ec) && !ec && !fs::remove(path, ec)) {
        logger_->warn("Unable to remove empty directory {}: {}", path.string(), ec.message());
      }
      continue;
    }
    if(!fs::remove(path, ec)) {
      if(ec) throw std::runtime_error("Unable to delete " + path.string() + ": " + ec.message());
      continue;
    }
    ++removed;
    changed.store(true, std::memory_order_release);
    logger_->debug("deleted: {}", relative);
  }

  auto result = builder.freeze(changed.load(std::memory_order_acquire));
  logger_->info("Synced {} resources into {} ({} stale removed, {})",
                result.size(), build_folder_.string(), removed,
                result.changed() ? "changed" : "unchanged");
  return result;
}
