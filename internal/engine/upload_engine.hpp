#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/engine/admission_gate.hpp"
#include "internal/engine/run_report.hpp"
#include "internal/planner/upload_planner.hpp"
#include "internal/progress/progress_monitor.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/cancellation.hpp"

namespace upload::completion {
class CompletionCoordinator;
}

namespace upload::engine {

struct EngineOptions {
  std::size_t   threads             = 4;
  std::uint64_t part_size           = 128ULL * 1024 * 1024;
  std::uint64_t multipart_threshold = 128ULL * 1024 * 1024;
  std::uint64_t window_bytes        = 1024ULL * 1024 * 1024;
  std::string   record_tag_key      = "X-COS-RECORD-ID";
  // files planned but not yet terminal, each holding at most one open file; 0 means 2 * threads
  std::size_t max_active_files = 0;
};

/*
  Uploads a batch of files.

  Run() plans files one at a time on the calling thread while a fixed
  worker pool transfers whatever has been planned so far; a single
  completion coordinator applies every result. Planning pauses while
  max_active_files files are still in progress. Returns once every file is
  terminal. Cancel() may be called from any thread (signal handlers
  included, via a watcher thread). An engine runs once.
*/
class UploadEngine {
 public:
  UploadEngine(EngineOptions options, storage::ObjectStorePtr store, std::shared_ptr<checkpoint::CheckpointStore> checkpoints,
               std::shared_ptr<progress::ProgressMonitor> monitor);
  ~UploadEngine();

  UploadEngine(const UploadEngine&)            = delete;
  UploadEngine& operator=(const UploadEngine&) = delete;

  RunReport Run(const std::vector<planner::UploadRequest>& requests);

  void Cancel();

 private:
  EngineOptions                                options_;
  storage::ObjectStorePtr                      store_;
  std::shared_ptr<checkpoint::CheckpointStore> checkpoints_;
  std::shared_ptr<progress::ProgressMonitor>   monitor_;
  planner::UploadPlanner                       planner_;
  util::CancellationToken                      cancel_;
  AdmissionGate                                admission_;

  std::mutex                         coordinator_mutex_;
  completion::CompletionCoordinator* coordinator_ = nullptr;
  bool                               ran_         = false;
};

} // namespace upload::engine
