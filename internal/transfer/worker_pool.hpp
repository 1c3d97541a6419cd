#pragma once

#include <memory>
#include <vector>

#include "internal/transfer/upload_worker.hpp"

namespace upload::transfer {

/*
  Fixed set of UploadWorkers sharing one bounded task queue.

  The queue holds at most kQueuedPerWorker tasks per worker; Submit()
  blocks while it is full.
*/
class WorkerPool {
 public:
  WorkerPool(std::size_t threads, storage::ObjectStorePtr store, ResultSink results, ProgressSink progress, const util::CancellationToken& cancel);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // false once the pool has been stopped
  bool Submit(UploadTask task);

  static constexpr std::size_t kQueuedPerWorker = 2;

  // Tasks not yet picked up by a worker.
  std::vector<UploadTask> DrainPending();
  std::vector<UploadTask> DrainPending(model::FileId file_id);

  // Closes the queue and joins every worker after it finishes what is queued.
  void Stop();

 private:
  std::shared_ptr<TaskQueue>                 tasks_;
  std::vector<std::unique_ptr<UploadWorker>> workers_;
  bool                                       started_ = false;
};

} // namespace upload::transfer
