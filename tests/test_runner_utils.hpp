#pragma once

#include "build_strategy.hpp"
#include "log.hpp"
#include "pack_resource.hpp"

#include <nlohmann/json.hpp>
#include <miniz.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace pack::test {

inline std::vector<char> bytes_of(const std::string& text) {
  return std::vector<char>(text.begin(), text.end());
}

inline std::string read_text(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_text(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

// Fresh directory under the system temp folder, removed on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& label) {
    static std::atomic<unsigned> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("packgen_" + label + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path operator/(const std::string& child) const { return root_ / child; }

private:
  std::filesystem::path root_;
};

// Serves a fixed resource set. Each build_resources() call hands out fresh
// resources, so the same provider can drive several builds.
class MemoryProvider : public ResourceProvider {
public:
  MemoryProvider() = default;
  MemoryProvider(std::initializer_list<std::pair<const PackPath, std::string>> files)
    : files_(files) {}

  void set(const PackPath& location, const std::string& content) { files_[location] = content; }
  void erase(const PackPath& location) { files_.erase(location); }
  void clear() { files_.clear(); }
  void fail_on(const PackPath& location) { failing_ = location; has_failure_ = true; }
  void reverse_order(bool enabled) { reverse_ = enabled; }
  void set_meta(nlohmann::json meta) { meta_ = std::move(meta); }

  std::size_t supplier_calls() const { return supplier_calls_.load(); }

  PackBuild build_resources() override {
    PackBuild build;
    build.meta = meta_;
    std::vector<std::pair<PackPath, std::string>> ordered(files_.begin(), files_.end());
    if(reverse_) std::reverse(ordered.begin(), ordered.end());
    for(const auto& [location, content] : ordered) {
      bool fail = has_failure_ && location == failing_;
      auto text = content;
      build.add(location, text.size(), [this, text, fail, name = location.full_path()]{
        ++supplier_calls_;
        if(fail) throw std::runtime_error("cannot produce " + name);
        return bytes_of(text);
      });
    }
    return build;
  }

private:
  std::map<PackPath, std::string> files_;
  nlohmann::json meta_ = nlohmann::json::object();
  PackPath failing_;
  bool has_failure_ = false;
  bool reverse_ = false;
  std::atomic<std::size_t> supplier_calls_{0};
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard lg(mutex_);
        lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
        return true;
      });
    std::lock_guard lg(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard lg(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      attachment.logger->remove_listener(attachment.handle);
    }
  }

  void clear() {
    std::lock_guard lg(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard lg(mutex_);
    return lines_;
  }

  std::size_t count_substring(const std::string& needle) const {
    std::lock_guard lg(mutex_);
    return static_cast<std::size_t>(std::count_if(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; }));
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

// Archive contents read back through miniz. miniz does not expose the
// archive comment, so it is taken from the end of central directory record.
struct ZipListing {
  std::string comment;
  std::vector<std::string> names;
  std::map<std::string, std::string> contents;
};

inline std::string archive_comment(const std::string& data) {
  static const std::string kEndOfCentralDirectory("PK\x05\x06", 4);
  auto pos = data.rfind(kEndOfCentralDirectory);
  if(pos == std::string::npos || pos + 22 > data.size()) {
    throw std::runtime_error("missing end of central directory");
  }
  auto length = static_cast<std::size_t>(static_cast<unsigned char>(data[pos + 20])) |
                (static_cast<std::size_t>(static_cast<unsigned char>(data[pos + 21])) << 8);
  return data.substr(pos + 22, length);
}

inline ZipListing read_zip(const std::filesystem::path& path) {
  ZipListing listing;
  mz_zip_archive zip{};
  if(!mz_zip_reader_init_file(&zip, path.string().c_str(), 0)) {
    throw std::runtime_error("Unable to open zip " + path.string());
  }
  try {
    const mz_uint count = mz_zip_reader_get_num_files(&zip);
    for(mz_uint i = 0; i < count; ++i) {
      mz_zip_archive_file_stat stat;
      if(!mz_zip_reader_file_stat(&zip, i, &stat)) {
        throw std::runtime_error("Unable to stat entry " + std::to_string(i));
      }
      std::string content;
      if(stat.m_uncomp_size > 0) {
        std::size_t size = 0;
        void* data = mz_zip_reader_extract_to_heap(&zip, i, &size, 0);
        if(!data) throw std::runtime_error(std::string("Unable to extract ") + stat.m_filename);
        content.assign(static_cast<const char*>(data), size);
        mz_free(data);
      }
      listing.names.emplace_back(stat.m_filename);
      listing.contents[stat.m_filename] = std::move(content);
    }
  } catch(...) {
    mz_zip_reader_end(&zip);
    throw;
  }
  mz_zip_reader_end(&zip);
  listing.comment = archive_comment(read_text(path));
  return listing;
}

} // namespace pack::test
