#include "zip_writer.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

// 2020-01-01 12:00 UTC. Every entry gets the same time so identical inputs
// produce identical archives; noon keeps the DOS date stable across zones.
constexpr MZ_TIME_T kEntryTime = 1577880000;

constexpr std::size_t kMaxCommentSize = std::numeric_limits<mz_uint16>::max();

} // namespace

ZipWriter::ZipWriter(std::filesystem::path target, mz_uint level)
  : target_(std::move(target)),
    level_(level) {
  temp_path_ = target_;
  temp_path_ += ".tmp";
  if(target_.has_parent_path()) {
    std::filesystem::create_directories(target_.parent_path());
  }
  if(!mz_zip_writer_init_file(&zip_, temp_path_.string().c_str(), 0)) {
    fail("Unable to create " + temp_path_.string());
  }
  open_ = true;
}

ZipWriter::~ZipWriter() {
  if(open_) mz_zip_writer_end(&zip_);
  if(finished_) return;
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

void ZipWriter::fail(const std::string& what) {
  throw std::runtime_error(what + ": " + mz_zip_get_error_string(mz_zip_get_last_error(&zip_)));
}

void ZipWriter::set_comment(std::string comment) {
  if(comment.size() > kMaxCommentSize) {
    throw std::invalid_argument("zip comment is too long");
  }
  comment_ = std::move(comment);
}

void ZipWriter::add_entry(const std::string& name, const std::vector<char>& data) {
  if(!open_) throw std::logic_error("zip archive already finished");
  if(name.empty()) throw std::invalid_argument("empty zip entry name");

  MZ_TIME_T modified = kEntryTime;
  if(!mz_zip_writer_add_mem_ex_v2(&zip_, name.c_str(), data.data(), data.size(),
                                  nullptr, 0, level_, 0, 0, &modified,
                                  nullptr, 0, nullptr, 0)) {
    fail("Failed to add " + name + " to " + temp_path_.string());
  }
}

// miniz always finalizes with an empty archive comment. The end of central
// directory record is the last thing in the file and its final field is the
// comment length, so the comment is patched in after the writer closes.
void ZipWriter::append_comment() const {
  if(comment_.empty()) return;
  std::fstream file(temp_path_, std::ios::in | std::ios::out | std::ios::binary);
  if(!file) throw std::runtime_error("Unable to reopen " + temp_path_.string());
  const auto size = static_cast<mz_uint16>(comment_.size());
  const char length[2] = {
    static_cast<char>(size & 0xff),
    static_cast<char>((size >> 8) & 0xff)
  };
  file.seekp(-2, std::ios::end);
  file.write(length, sizeof(length));
  file.write(comment_.data(), static_cast<std::streamsize>(comment_.size()));
  file.flush();
  if(!file) throw std::runtime_error("Unable to write comment to " + temp_path_.string());
}

void ZipWriter::finish() {
  if(finished_) return;
  if(!mz_zip_writer_finalize_archive(&zip_)) {
    fail("Failed to finalize " + temp_path_.string());
  }
  const bool closed = mz_zip_writer_end(&zip_);
  open_ = false;
  if(!closed) throw std::runtime_error("Unable to close " + temp_path_.string());

  append_comment();
  std::filesystem::rename(temp_path_, target_);
  finished_ = true;
}
