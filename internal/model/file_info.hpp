#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace upload::model {

// Stable per-run handle assigned at discovery; indexes the file table.
using FileId = std::uint32_t;

/*
  Per-file lifecycle:

      Unprocessed → PreviouslyUploaded
                  → UploadInProgress → MultipartCompletionInProgress → UploadCompleted
                                     → UploadCompleted                (single-shot)
                  → UploadFailed     (from any non-terminal state)
*/
enum class UploadStatus {
  kUnprocessed = 0,
  kPreviouslyUploaded,
  kUploadInProgress,
  kMultipartCompletionInProgress,
  kUploadCompleted,
  kUploadFailed,
};

inline bool IsTerminal(UploadStatus status) {
  return status == UploadStatus::kPreviouslyUploaded || status == UploadStatus::kUploadCompleted || status == UploadStatus::kUploadFailed;
}

inline std::string_view ToString(UploadStatus status) {
  switch (status) {
    case UploadStatus::kUnprocessed:
      return "Unprocessed";
    case UploadStatus::kPreviouslyUploaded:
      return "PreviouslyUploaded";
    case UploadStatus::kUploadInProgress:
      return "UploadInProgress";
    case UploadStatus::kMultipartCompletionInProgress:
      return "MultipartCompletionInProgress";
    case UploadStatus::kUploadCompleted:
      return "UploadCompleted";
    case UploadStatus::kUploadFailed:
      return "UploadFailed";
  }
  return "Unknown";
}

struct FileInfo {
  std::string   path;
  std::uint64_t size = 0;
  std::string   sha256;
  std::uint64_t uploaded_bytes = 0;
  UploadStatus  status         = UploadStatus::kUnprocessed;
};

} // namespace upload::model
