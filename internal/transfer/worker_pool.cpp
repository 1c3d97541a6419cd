#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace upload::transfer {

WorkerPool::WorkerPool(std::size_t threads, storage::ObjectStorePtr store, ResultSink results, ProgressSink progress,
                       const util::CancellationToken& cancel)
    : tasks_(std::make_shared<TaskQueue>(threads * kQueuedPerWorker)) {
  if (threads == 0) {
    throw util::InvalidArgument("worker pool needs at least one thread");
  }

  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.push_back(std::make_unique<UploadWorker>(static_cast<int>(i), tasks_, store, results, progress, cancel));
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (started_) return;
  started_ = true;

  for (auto& worker : workers_) {
    worker->Start();
  }
  UPLOAD_LOG_DEBUG("worker pool started", {observability::IntField("threads", static_cast<std::int64_t>(workers_.size()))});
}

bool WorkerPool::Submit(UploadTask task) {
  return tasks_->Push(std::move(task));
}

std::vector<UploadTask> WorkerPool::DrainPending() {
  return tasks_->Drain();
}

std::vector<UploadTask> WorkerPool::DrainPending(model::FileId file_id) {
  return tasks_->RemoveIf([file_id](const UploadTask& task) { return task.file_id == file_id; });
}

void WorkerPool::Stop() {
  tasks_->Close();
  for (auto& worker : workers_) {
    worker->Join();
  }
}

} // namespace upload::transfer
