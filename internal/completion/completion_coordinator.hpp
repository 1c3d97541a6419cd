#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "internal/engine/run_report.hpp"
#include "internal/planner/upload_planner.hpp"
#include "internal/progress/progress_monitor.hpp"
#include "internal/scheduler/part_window.hpp"
#include "internal/transfer/task_queue.hpp"
#include "internal/transfer/upload_task.hpp"
#include "internal/transfer/worker_pool.hpp"

namespace upload::completion {

struct FileDiscovered {
  model::FileId id = 0;
  std::string   path;
};

struct FilePlanned {
  model::FileId     id = 0;
  planner::FilePlan plan;
};

// planning failed; the file never reaches the pool
struct FileRejected {
  model::FileId id = 0;
  std::string   error;
};

struct SubmissionsClosed {};

// wakes the coordinator after the cancellation token fired
struct CancelRequested {};

using Event = std::variant<FileDiscovered, FilePlanned, FileRejected, transfer::TaskResult, SubmissionsClosed, CancelRequested>;

struct CoordinatorOptions {
  std::uint64_t window_bytes = 1024ULL * 1024 * 1024;
  // called on the coordinator thread once per file reaching a terminal status
  std::function<void(model::FileId)> on_terminal;
};

/*
  Single writer for all per-file upload state.

  Owns the file table (indexed by FileId), each file's PartWindow and its
  checkpoint handle. Feeds the worker pool, consumes every TaskResult, and
  is the only code that writes checkpoints or calls
  CompleteMultipartUpload. All of that happens on one thread, so
  checkpoint writes for a file are totally ordered and no state is locked.

  Finishes once submissions are closed, every file is terminal and no
  task is outstanding.
*/
class CompletionCoordinator {
 public:
  CompletionCoordinator(storage::ObjectStorePtr store, transfer::WorkerPool& pool, progress::ProgressMonitor& monitor, CoordinatorOptions options,
                        const util::CancellationToken& cancel);
  ~CompletionCoordinator();

  CompletionCoordinator(const CompletionCoordinator&)            = delete;
  CompletionCoordinator& operator=(const CompletionCoordinator&) = delete;

  void Start();

  void Post(Event event);

  // Blocks until finished.
  engine::RunReport Wait();

 private:
  struct FileEntry {
    model::FileInfo    info;
    model::Destination destination;
    bool               known = false;

    std::shared_ptr<storage::FileSource> reader;

    // multipart only
    std::optional<scheduler::PartLayout>   layout;
    std::unique_ptr<scheduler::PartWindow> window;
    checkpoint::Checkpoint                 progress;
    checkpoint::CheckpointHandlePtr        checkpoint;

    int         in_flight = 0;
    std::string error;
  };

  void Run();
  void Handle(Event& event);

  void OnDiscovered(const FileDiscovered& event);
  void OnPlanned(FilePlanned& event);
  void OnRejected(const FileRejected& event);
  void OnResult(const transfer::TaskResult& result);
  void OnCancel();

  void OnPartSucceeded(FileEntry& file, model::FileId id, const storage::UploadedPart& part);
  bool OpenReader(model::FileId id);
  void Dispatch(model::FileId id);
  void CompleteMultipart(model::FileId id);

  void SetStatus(model::FileId id, model::UploadStatus status, std::optional<std::uint64_t> total = std::nullopt,
                 std::optional<std::uint64_t> uploaded_bytes = std::nullopt);
  void Fail(model::FileId id, const std::string& error);
  void ReleaseIfIdle(FileEntry& file);

  FileEntry& Entry(model::FileId id);
  bool       Finished() const;

  engine::RunReport BuildReport() const;

  storage::ObjectStorePtr        store_;
  transfer::WorkerPool&          pool_;
  progress::ProgressMonitor&     monitor_;
  CoordinatorOptions             options_;
  const util::CancellationToken& cancel_;

  transfer::BlockingQueue<Event> events_;
  std::thread                    thread_;

  // touched only by the coordinator thread until Wait() joins it
  std::vector<FileEntry> files_;
  std::size_t            discovered_         = 0;
  std::size_t            terminal_           = 0;
  std::size_t            outstanding_tasks_  = 0;
  bool                   submissions_closed_ = false;
  bool                   cancel_handled_     = false;
};

} // namespace upload::completion
