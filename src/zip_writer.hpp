#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <miniz.h>

// Writes a ZIP archive through miniz into "<target>.tmp" and moves it over
// target on finish(). An unfinished writer deletes its temp file on
// destruction, so a failed build never replaces the previous archive.
class ZipWriter {
public:
  explicit ZipWriter(std::filesystem::path target, mz_uint level = MZ_BEST_COMPRESSION);
  ~ZipWriter();

  ZipWriter(const ZipWriter&) = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  void set_comment(std::string comment);
  // Names always use '/' separators.
  void add_entry(const std::string& name, const std::vector<char>& data);
  void finish();

private:
  [[noreturn]] void fail(const std::string& what);
  void append_comment() const;

  std::filesystem::path target_;
  std::filesystem::path temp_path_;
  mz_uint level_;
  std::string comment_;
  mz_zip_archive zip_{};
  bool open_ = false;
  bool finished_ = false;
};
