#include "file_source.hpp"

#include <arrow/io/file.h>

#include <algorithm>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace upload::storage {

using common::Unwrap;

FileSource::FileSource(std::shared_ptr<arrow::io::RandomAccessFile> file, std::string path, std::uint64_t size)
    : file_(std::move(file)), path_(std::move(path)), size_(size) {
}

std::shared_ptr<FileSource> FileSource::Open(const std::string& path) {
  auto file = Unwrap<util::PlanningError>(arrow::io::ReadableFile::Open(path), "open " + path);
  auto size = Unwrap<util::PlanningError>(file->GetSize(), "stat " + path);
  return std::make_shared<FileSource>(std::move(file), path, static_cast<std::uint64_t>(size));
}

std::uint64_t FileSource::ReadAt(std::uint64_t offset, std::uint64_t length, void* out) const {
  if (offset >= size_ || length == 0) return 0;
  const auto to_read = std::min<std::uint64_t>(length, size_ - offset);
  auto       read    = Unwrap<util::TransportError>(file_->ReadAt(static_cast<std::int64_t>(offset), static_cast<std::int64_t>(to_read), out), "read " + path_);
  return static_cast<std::uint64_t>(read);
}

void FileSource::Close() {
  if (!file_->closed()) {
    Unwrap(file_->Close(), "close " + path_);
  }
}

// ------------------------------------------------------------------
// RangeReader
// ------------------------------------------------------------------

RangeReader::RangeReader(ByteRange range, ProgressFn progress, const util::CancellationToken* cancel)
    : range_(std::move(range)), progress_(std::move(progress)), cancel_(cancel) {
  if (!range_.source) {
    throw util::InvalidArgument("byte range has no source");
  }
  if (range_.offset + range_.length > range_.source->Size()) {
    throw util::InvalidArgument("byte range exceeds file size: " + range_.source->Path());
  }
}

std::size_t RangeReader::Read(void* out, std::size_t max) {
  if (Cancelled()) throw util::Cancelled();

  const auto remaining = range_.length - position_;
  if (remaining == 0 || max == 0) return 0;

  const auto want = std::min<std::uint64_t>(remaining, max);
  const auto got  = range_.source->ReadAt(range_.offset + position_, want, out);
  if (got == 0) {
    throw util::TransportError("unexpected end of file while reading " + range_.source->Path());
  }

  position_ += got;
  if (position_ > high_water_) {
    high_water_ = position_;
    Report();
  }
  return static_cast<std::size_t>(got);
}

void RangeReader::Seek(std::uint64_t position) {
  if (position > range_.length) {
    throw util::InvalidArgument("seek beyond end of range");
  }
  position_ = position;
}

std::string RangeReader::ReadRemaining() {
  std::string data(static_cast<std::size_t>(range_.length - position_), '\0');
  std::size_t filled = 0;
  while (filled < data.size()) {
    // chunked so progress and cancellation are observed while reading
    const auto n = Read(data.data() + filled, std::min<std::size_t>(data.size() - filled, 1 << 20));
    if (n == 0) break;
    filled += n;
  }
  data.resize(filled);
  return data;
}

void RangeReader::Report() {
  if (!progress_) return;
  const auto threshold = range_.length / 20;
  if (high_water_ - reported_ > threshold || high_water_ == range_.length) {
    progress_(high_water_ - reported_);
    reported_ = high_water_;
  }
}

// ------------------------------------------------------------------
// RangeStreamBuf
// ------------------------------------------------------------------

RangeStreamBuf::RangeStreamBuf(RangeReader reader, std::size_t buffer_size) : reader_(std::move(reader)), buffer_(buffer_size) {
  setg(buffer_.data(), buffer_.data(), buffer_.data());
}

RangeStreamBuf::int_type RangeStreamBuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }
  if (reader_.Cancelled()) {
    return traits_type::eof();
  }

  const auto n = reader_.Read(buffer_.data(), buffer_.size());
  if (n == 0) {
    return traits_type::eof();
  }
  setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
  return traits_type::to_int_type(*gptr());
}

std::streamsize RangeStreamBuf::showmanyc() {
  const auto remaining = reader_.Length() - reader_.Position();
  return remaining == 0 ? -1 : static_cast<std::streamsize>(remaining);
}

RangeStreamBuf::pos_type RangeStreamBuf::seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) {
  if (!(which & std::ios_base::in)) return pos_type(off_type(-1));

  // logical position = bytes consumed by the reader minus what is still buffered
  const auto current = static_cast<off_type>(reader_.Position()) - static_cast<off_type>(egptr() - gptr());

  off_type target = 0;
  switch (dir) {
    case std::ios_base::beg:
      target = off;
      break;
    case std::ios_base::cur:
      target = current + off;
      break;
    case std::ios_base::end:
      target = static_cast<off_type>(reader_.Length()) + off;
      break;
    default:
      return pos_type(off_type(-1));
  }

  if (target < 0 || target > static_cast<off_type>(reader_.Length())) {
    return pos_type(off_type(-1));
  }
  if (target == current) {
    return pos_type(target);
  }

  reader_.Seek(static_cast<std::uint64_t>(target));
  setg(buffer_.data(), buffer_.data(), buffer_.data());
  return pos_type(target);
}

RangeStreamBuf::pos_type RangeStreamBuf::seekpos(pos_type pos, std::ios_base::openmode which) {
  return seekoff(off_type(pos), std::ios_base::beg, which);
}

} // namespace upload::storage
