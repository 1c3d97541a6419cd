#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <streambuf>
#include <string>
#include <vector>

#include "internal/util/cancellation.hpp"

namespace upload::storage {

// Receives the number of newly read bytes since the previous call.
using ProgressFn = std::function<void(std::uint64_t delta)>;

/*
  Read-only file handle shared by every worker uploading a range of the
  same file. Reads are positional (pread), so concurrent readers of
  disjoint ranges never interfere.
*/
class FileSource {
 public:
  FileSource(std::shared_ptr<arrow::io::RandomAccessFile> file, std::string path, std::uint64_t size);

  static std::shared_ptr<FileSource> Open(const std::string& path);

  const std::string& Path() const {
    return path_;
  }

  std::uint64_t Size() const {
    return size_;
  }

  // Returns the number of bytes read; short only at end of file.
  std::uint64_t ReadAt(std::uint64_t offset, std::uint64_t length, void* out) const;

  void Close();

 private:
  std::shared_ptr<arrow::io::RandomAccessFile> file_;
  std::string                                  path_;
  std::uint64_t                                size_;
};

struct ByteRange {
  std::shared_ptr<FileSource> source;
  std::uint64_t               offset = 0;
  std::uint64_t               length = 0;
};

/*
  Bounded, rewindable view over one ByteRange.

  Progress is reported against the furthest position ever read, so a
  consumer that rewinds (checksum pre-scan, request retry) never counts
  the same byte twice. Deltas are batched to roughly 1/20th of the range.
*/
class RangeReader {
 public:
  RangeReader(ByteRange range, ProgressFn progress = {}, const util::CancellationToken* cancel = nullptr);

  // Returns 0 at end of range. Throws util::Cancelled once cancellation is requested.
  std::size_t Read(void* out, std::size_t max);

  void Seek(std::uint64_t position);

  std::uint64_t Position() const {
    return position_;
  }

  std::uint64_t Length() const {
    return range_.length;
  }

  bool Cancelled() const {
    return cancel_ != nullptr && cancel_->IsCancelled();
  }

  std::string ReadRemaining();

 private:
  void Report();

  ByteRange                      range_;
  ProgressFn                     progress_;
  const util::CancellationToken* cancel_;

  std::uint64_t position_   = 0;
  std::uint64_t high_water_ = 0;
  std::uint64_t reported_   = 0;
};

/*
  std::streambuf adapter so iostream based HTTP clients can stream a range
  without materializing it. Seekable within the range.
*/
class RangeStreamBuf : public std::streambuf {
 public:
  explicit RangeStreamBuf(RangeReader reader, std::size_t buffer_size = 256 * 1024);

 protected:
  int_type        underflow() override;
  std::streamsize showmanyc() override;
  pos_type        seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) override;
  pos_type        seekpos(pos_type pos, std::ios_base::openmode which) override;

 private:
  RangeReader       reader_;
  std::vector<char> buffer_;
};

} // namespace upload::storage
