#pragma once

#include <filesystem>
#include <memory>
#include <string>

class Logger;

// Persists the last build hash in a marker file under a private cache
// directory and tells whether a new hash differs from it.
class ChangeDetector {
public:
  static constexpr const char* kDefaultMarkerName = "zip-hash.txt";

  explicit ChangeDetector(std::filesystem::path cache_directory,
                          std::string marker_name = kDefaultMarkerName,
                          std::shared_ptr<Logger> logger = nullptr);

  // True when no readable marker exists or its content differs; the marker
  // is then rewritten. The marker is not touched when this returns false.
  bool check_and_update(const std::string& hash);

  // Drops the marker so the next check reports a change.
  void invalidate();

  const std::filesystem::path& marker_path() const { return marker_path_; }

private:
  std::filesystem::path cache_directory_;
  std::filesystem::path marker_path_;
  std::shared_ptr<Logger> logger_;
};
