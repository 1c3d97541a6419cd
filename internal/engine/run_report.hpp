#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/file_info.hpp"

namespace upload::engine {

struct FileOutcome {
  std::string         path;
  model::UploadStatus status         = model::UploadStatus::kUnprocessed;
  std::uint64_t       size           = 0;
  std::uint64_t       uploaded_bytes = 0;
  // empty unless status is kUploadFailed
  std::string error;
};

/*
  End-of-run summary, one entry per submitted file in submission order.
*/
struct RunReport {
  std::vector<FileOutcome> files;

  std::size_t Count(model::UploadStatus status) const;

  std::size_t Failed() const {
    return Count(model::UploadStatus::kUploadFailed);
  }

  bool AllSucceeded() const {
    return Failed() == 0;
  }

  // "\n<n> files failed to upload\n" followed by one "Upload <path> failed with: \n<error>\n\n" per failure.
  std::string FailureReport() const;

  // One "<path>: <status>" line per file.
  std::string Summary() const;

  // What the CLI prints at exit: Summary() then FailureReport().
  std::string Render() const;
};

} // namespace upload::engine
