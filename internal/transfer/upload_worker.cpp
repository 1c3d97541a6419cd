#include "upload_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace upload::transfer {

using observability::BytesField;
using observability::IntField;
using observability::StringField;

UploadWorker::UploadWorker(int id, std::shared_ptr<TaskQueue> tasks, storage::ObjectStorePtr store, ResultSink results, ProgressSink progress,
                           const util::CancellationToken& cancel)
    : id_(id),
      tasks_(std::move(tasks)),
      store_(std::move(store)),
      results_(std::move(results)),
      progress_(std::move(progress)),
      cancel_(cancel) {
}

UploadWorker::~UploadWorker() {
  Join();
}

void UploadWorker::Start() {
  thread_ = std::thread(&UploadWorker::Run, this);
}

void UploadWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void UploadWorker::Run() {
  while (auto task = tasks_->Pop()) {
    results_(Execute(*task));
  }
  UPLOAD_LOG_DEBUG("upload worker exiting", {IntField("worker", id_)});
}

TaskResult UploadWorker::Execute(const UploadTask& task) {
  TaskResult result;
  result.file_id     = task.file_id;
  result.part_number = task.part_number;

  if (cancel_.IsCancelled()) {
    result.error     = util::Cancelled().what();
    result.cancelled = true;
    return result;
  }

  storage::ProgressFn progress;
  if (progress_) {
    progress = [this, file_id = task.file_id](std::uint64_t delta) { progress_(file_id, delta); };
  }

  storage::ByteRange range{task.reader, task.offset, task.length};

  try {
    if (task.IsMultipart()) {
      UPLOAD_LOG_DEBUG("uploading part",
                       {StringField("path", task.path), IntField("part", task.part_number), IntField("of", task.total_parts), IntField("worker", id_)});
      result.part = store_->UploadPart(task.destination, *task.upload_id, task.part_number, range, progress, cancel_);
    } else {
      UPLOAD_LOG_DEBUG("uploading object", {StringField("path", task.path), BytesField("bytes", task.length)});
      store_->PutObject(task.destination, range, progress, cancel_);
    }
  } catch (const util::Cancelled& e) {
    result.error     = e.what();
    result.cancelled = true;
  } catch (const std::exception& e) {
    result.error = e.what();
    if (cancel_.IsCancelled()) {
      result.cancelled = true;
    }
    UPLOAD_LOG_DEBUG("upload task failed", {StringField("path", task.path), IntField("part", task.part_number), StringField("error", e.what())});
  }

  return result;
}

} // namespace upload::transfer
