#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

#include "internal/model/file_info.hpp"
#include "internal/transfer/task_queue.hpp"

namespace upload::progress {

struct AddFile {
  model::FileId id = 0;
  std::string   path;
  std::uint64_t size = 0;
};

struct UpdateBytes {
  model::FileId id    = 0;
  std::uint64_t delta = 0;
};

struct StatusChange {
  model::FileId       id = 0;
  model::UploadStatus status;
  // file size, once known
  std::optional<std::uint64_t> total;
  // absolute byte count, e.g. the resume baseline
  std::optional<std::uint64_t> uploaded_bytes;
};

using Event = std::variant<AddFile, UpdateBytes, StatusChange>;

struct MonitorOptions {
  bool          hidden = false;
  std::uint32_t fps    = 4;
  std::uint32_t width  = 100;
  // redraw in place with ANSI escapes; otherwise only the final frame is written
  bool          ansi = false;
  std::ostream* out  = nullptr;
};

struct FileProgress {
  std::string         path;
  std::uint64_t       size  = 0;
  std::uint64_t       bytes = 0;
  model::UploadStatus status = model::UploadStatus::kUnprocessed;
};

struct Summary {
  std::size_t total     = 0;
  std::size_t skipped   = 0;
  std::size_t succeeded = 0;
  std::size_t failed    = 0;

  std::size_t Remaining() const {
    return total - skipped - succeeded;
  }
};

Summary Summarize(const std::vector<FileProgress>& files);

// "Upload Status:" header, one line per file, then "Total: N, Skipped: S, Success: C[, Remaining: R]".
std::string RenderTable(const std::vector<FileProgress>& files, std::uint32_t width);

/*
  Single-threaded aggregator of upload progress.

  Producers Post() events without blocking; the monitor thread applies
  them in order and renders at most fps frames per second. When events
  back up it keeps applying and skips frames. Hidden mode drops every
  event on the floor.
*/
class ProgressMonitor {
 public:
  explicit ProgressMonitor(MonitorOptions options);
  ~ProgressMonitor();

  ProgressMonitor(const ProgressMonitor&)            = delete;
  ProgressMonitor& operator=(const ProgressMonitor&) = delete;

  void Start();

  void Post(Event event);

  // Applies everything posted so far, renders the final frame and joins.
  void Stop();

  // Valid after Stop().
  const std::vector<FileProgress>& Files() const {
    return files_;
  }

 private:
  void Run();
  void Apply(const Event& event);
  void Render();

  FileProgress* Find(model::FileId id);

  MonitorOptions                      options_;
  transfer::BlockingQueue<Event>      events_;
  std::thread                         thread_;
  std::chrono::steady_clock::duration frame_interval_;

  // owned by the monitor thread; files_ is in AddFile order
  std::vector<FileProgress>                      files_;
  std::unordered_map<model::FileId, std::size_t> index_;
  std::size_t                                    last_frame_lines_ = 0;
};

} // namespace upload::progress
