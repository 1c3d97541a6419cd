#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "internal/storage/object_store.hpp"
#include "internal/transfer/task_queue.hpp"
#include "internal/transfer/upload_task.hpp"
#include "internal/util/cancellation.hpp"

namespace upload::transfer {

using TaskQueue    = BlockingQueue<UploadTask>;
using ResultSink   = std::function<void(TaskResult)>;
using ProgressSink = std::function<void(model::FileId, std::uint64_t delta)>;

/*
  Pulls UploadTasks until the queue closes and performs the transfer:
      single-shot → ObjectStore::PutObject
      multipart   → ObjectStore::UploadPart over [offset, offset + length)

  Every task yields exactly one TaskResult.
*/
class UploadWorker {
 public:
  UploadWorker(int id, std::shared_ptr<TaskQueue> tasks, storage::ObjectStorePtr store, ResultSink results, ProgressSink progress,
               const util::CancellationToken& cancel);
  ~UploadWorker();

  UploadWorker(const UploadWorker&)            = delete;
  UploadWorker& operator=(const UploadWorker&) = delete;

  void Start();

  // Joins; the task queue must already be closed.
  void Join();

  // Runs one task on the calling thread.
  TaskResult Execute(const UploadTask& task);

 private:
  void Run();

  int                            id_;
  std::shared_ptr<TaskQueue>     tasks_;
  storage::ObjectStorePtr        store_;
  ResultSink                     results_;
  ProgressSink                   progress_;
  const util::CancellationToken& cancel_;

  std::thread thread_;
};

} // namespace upload::transfer
