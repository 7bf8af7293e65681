#include "change_detector.hpp"

#include <fstream>
#include <iterator>
#include <optional>

#include "log.hpp"

namespace {

std::optional<std::string> read_marker(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(in.bad()) return std::nullopt;
  return content;
}

} // namespace

ChangeDetector::ChangeDetector(std::filesystem::path cache_directory,
                               std::string marker_name,
                               std::shared_ptr<Logger> logger)
  : cache_directory_(std::move(cache_directory)),
    marker_path_(cache_directory_ / marker_name),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("change-detector")) {}

bool ChangeDetector::check_and_update(const std::string& hash) {
  auto previous = read_marker(marker_path_);
  if(previous && *previous == hash) {
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(cache_directory_, ec);
  if(ec) {
    logger_->warn("Unable to create cache directory {}: {}", cache_directory_.string(), ec.message());
    return true;
  }
  std::ofstream out(marker_path_, std::ios::binary | std::ios::trunc);
  out << hash;
  out.flush();
  if(!out) {
    logger_->warn("Unable to write hash marker {}", marker_path_.string());
  }
  return true;
}

void ChangeDetector::invalidate() {
  std::error_code ec;
  std::filesystem::remove(marker_path_, ec);
  if(ec) {
    logger_->warn("Unable to remove hash marker {}: {}", marker_path_.string(), ec.message());
  }
}
