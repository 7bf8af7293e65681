#include "archive_writer.hpp"

#include <algorithm>

#include "log.hpp"
#include "parallel_engine.hpp"
#include "zip_writer.hpp"

ArchiveWriter::ArchiveWriter(std::filesystem::path archive_file,
                             std::filesystem::path cache_directory,
                             std::shared_ptr<Logger> logger)
  : archive_file_(std::move(archive_file)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("pack-zip")),
    detector_(std::move(cache_directory), ChangeDetector::kDefaultMarkerName, logger_),
    exists_(std::filesystem::exists(archive_file_)) {}

BuildResult ArchiveWriter::create(ResourceProvider& provider, ParallelEngine& engine) {
  auto build = provider.build_resources();
  BuildResultBuilder builder(std::move(build.meta));
  collect_resources(build, builder, engine, *logger_);

  auto result = builder.freeze_by_hash([this](const std::string& hash){
    // The marker is refreshed first; a missing archive is rebuilt even when
    // the recorded hash still matches.
    const bool changed = detector_.check_and_update(hash);
    return changed || !std::filesystem::is_regular_file(archive_file_);
  });
  if(!result.changed()) {
    logger_->info("Pack unchanged ({} resources), keeping {}", result.size(), archive_file_.string());
    return result;
  }

  try {
    write_archive(result);
  } catch(const std::exception& e) {
    // The marker already holds the new hash; drop it so the next build retries.
    detector_.invalidate();
    logger_->error("Failed to write {}: {}", archive_file_.string(), e.what());
    throw;
  }
  logger_->info("Wrote {} resources to {}", result.size(), archive_file_.string());
  return result;
}

void ArchiveWriter::write_archive(const BuildResult& result) {
  ZipWriter zip(archive_file_);
  zip.set_comment(kArchiveComment);
  for(const auto& [location, bytes] : result.entries()) {
    auto name = location.full_path();
    std::replace(name.begin(), name.end(), '\\', '/');
    zip.add_entry(name, bytes);
  }
  zip.finish();
}
