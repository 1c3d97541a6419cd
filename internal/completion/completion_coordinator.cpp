#include "completion_coordinator.hpp"

#include <algorithm>
#include <type_traits>

#include <spdlog/fmt/fmt.h>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace upload::completion {

using model::UploadStatus;
using observability::BytesField;
using observability::IntField;
using observability::StringField;

CompletionCoordinator::CompletionCoordinator(storage::ObjectStorePtr store, transfer::WorkerPool& pool, progress::ProgressMonitor& monitor,
                                             CoordinatorOptions options, const util::CancellationToken& cancel)
    : store_(std::move(store)), pool_(pool), monitor_(monitor), options_(std::move(options)), cancel_(cancel) {
}

CompletionCoordinator::~CompletionCoordinator() {
  events_.Close();
  if (thread_.joinable()) thread_.join();
}

void CompletionCoordinator::Start() {
  thread_ = std::thread(&CompletionCoordinator::Run, this);
}

void CompletionCoordinator::Post(Event event) {
  events_.Push(std::move(event));
}

engine::RunReport CompletionCoordinator::Wait() {
  if (thread_.joinable()) thread_.join();
  return BuildReport();
}

void CompletionCoordinator::Run() {
  while (!Finished()) {
    auto event = events_.Pop();
    if (!event) break;

    Handle(*event);

    if (cancel_.IsCancelled() && !cancel_handled_) {
      OnCancel();
    }
  }
}

void CompletionCoordinator::Handle(Event& event) {
  std::visit(
      [this](auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, FileDiscovered>) {
          OnDiscovered(e);
        } else if constexpr (std::is_same_v<T, FilePlanned>) {
          OnPlanned(e);
        } else if constexpr (std::is_same_v<T, FileRejected>) {
          OnRejected(e);
        } else if constexpr (std::is_same_v<T, transfer::TaskResult>) {
          OnResult(e);
        } else if constexpr (std::is_same_v<T, SubmissionsClosed>) {
          submissions_closed_ = true;
        }
      },
      event);
}

bool CompletionCoordinator::Finished() const {
  return submissions_closed_ && terminal_ == discovered_ && outstanding_tasks_ == 0;
}

CompletionCoordinator::FileEntry& CompletionCoordinator::Entry(model::FileId id) {
  if (id >= files_.size()) {
    files_.resize(static_cast<std::size_t>(id) + 1);
  }
  return files_[id];
}

void CompletionCoordinator::OnDiscovered(const FileDiscovered& event) {
  auto& file = Entry(event.id);
  if (file.known) return;

  file.known     = true;
  file.info.path = event.path;
  ++discovered_;
  monitor_.Post(progress::AddFile{event.id, event.path, 0});
}

void CompletionCoordinator::OnRejected(const FileRejected& event) {
  Fail(event.id, event.error);
}

void CompletionCoordinator::OnPlanned(FilePlanned& event) {
  auto  id   = event.id;
  auto& file = Entry(id);
  auto& plan = event.plan;

  file.info        = plan.info;
  file.info.status = UploadStatus::kUnprocessed;
  file.destination = plan.destination;

  if (std::holds_alternative<planner::SkipPlan>(plan.kind)) {
    SetStatus(id, UploadStatus::kPreviouslyUploaded, file.info.size, file.info.size);
    return;
  }

  if (cancel_.IsCancelled()) {
    Fail(id, util::Cancelled().what());
    return;
  }

  if (std::holds_alternative<planner::SinglePlan>(plan.kind)) {
    SetStatus(id, UploadStatus::kUploadInProgress, file.info.size, 0);
    if (!OpenReader(id)) return;

    transfer::UploadTask task;
    task.file_id     = id;
    task.path        = file.info.path;
    task.destination = file.destination;
    task.length      = file.info.size;
    task.reader      = file.reader;
    if (!pool_.Submit(std::move(task))) {
      Fail(id, "worker pool stopped");
      return;
    }
    ++file.in_flight;
    ++outstanding_tasks_;
    return;
  }

  auto& multipart = std::get<planner::MultipartPlan>(plan.kind);
  file.layout     = multipart.layout;
  file.checkpoint = multipart.handle;
  file.progress   = std::move(multipart.baseline);

  try {
    file.window = std::make_unique<scheduler::PartWindow>(file.layout->total_parts, file.layout->part_size, options_.window_bytes,
                                                          file.progress.PartNumbers());
  } catch (const std::exception& e) {
    Fail(id, e.what());
    return;
  }

  file.info.uploaded_bytes = file.progress.uploaded_bytes;
  SetStatus(id, UploadStatus::kUploadInProgress, file.info.size, file.progress.uploaded_bytes);

  if (file.window->Done()) {
    CompleteMultipart(id);
    return;
  }
  Dispatch(id);
}

void CompletionCoordinator::Dispatch(model::FileId id) {
  auto& file = Entry(id);
  if (cancel_.IsCancelled() || !file.window || model::IsTerminal(file.info.status)) {
    return;
  }
  if (!file.reader && file.window->CanDispatch() && !OpenReader(id)) {
    return;
  }

  // Submit() may block on a full pool queue, during which cancellation can fire
  while (!cancel_.IsCancelled()) {
    auto part = file.window->Next();
    if (!part) break;

    transfer::UploadTask task;
    task.file_id     = id;
    task.path        = file.info.path;
    task.destination = file.destination;
    task.upload_id   = file.progress.upload_id;
    task.part_number = *part;
    task.total_parts = file.layout->total_parts;
    task.offset      = file.layout->Offset(*part);
    task.length      = file.layout->Length(*part);
    task.reader      = file.reader;
    task.checkpoint  = file.checkpoint;

    if (!pool_.Submit(std::move(task))) {
      file.window->Abandon(*part);
      Fail(id, "worker pool stopped");
      return;
    }
    ++file.in_flight;
    ++outstanding_tasks_;
  }
}

bool CompletionCoordinator::OpenReader(model::FileId id) {
  auto& file = Entry(id);
  try {
    file.reader = storage::FileSource::Open(file.info.path);
  } catch (const std::exception& e) {
    Fail(id, e.what());
    return false;
  }
  if (file.reader->Size() != file.info.size) {
    Fail(id, "size of " + file.info.path + " changed since it was planned: " + std::to_string(file.info.size) + " -> " +
                 std::to_string(file.reader->Size()));
    return false;
  }
  return true;
}

void CompletionCoordinator::OnResult(const transfer::TaskResult& result) {
  auto  id   = result.file_id;
  auto& file = Entry(id);
  --outstanding_tasks_;
  --file.in_flight;

  if (model::IsTerminal(file.info.status)) {
    UPLOAD_LOG_DEBUG("discarding result for finished file", {StringField("path", file.info.path), IntField("part", result.part_number)});
    ReleaseIfIdle(file);
    return;
  }

  if (!result.Ok()) {
    if (file.window) file.window->Abandon(result.part_number);
    Fail(id, result.cancelled ? std::string(util::Cancelled().what()) : result.error);
    return;
  }

  if (!file.window) {
    file.info.uploaded_bytes = file.info.size;
    ReleaseIfIdle(file);
    SetStatus(id, UploadStatus::kUploadCompleted, std::nullopt, file.info.size);
    UPLOAD_LOG_INFO("upload completed", {StringField("path", file.info.path), BytesField("bytes", file.info.size)});
    return;
  }

  if (!result.part) {
    Fail(id, "part " + std::to_string(result.part_number) + " succeeded without part metadata");
    return;
  }
  OnPartSucceeded(file, id, *result.part);
}

void CompletionCoordinator::OnPartSucceeded(FileEntry& file, model::FileId id, const storage::UploadedPart& part) {
  file.progress.parts.push_back(part);
  file.progress.uploaded_bytes += part.size;

  try {
    file.checkpoint->Save(file.progress);
  } catch (const std::exception& e) {
    Fail(id, std::string("checkpoint update failed: ") + e.what());
    return;
  }

  file.window->MarkCompleted(part.part_number);
  file.info.uploaded_bytes = file.progress.uploaded_bytes;
  UPLOAD_LOG_DEBUG("part completed", {StringField("path", file.info.path), IntField("part", part.part_number),
                                      IntField("done", static_cast<std::int64_t>(file.window->Completed())),
                                      IntField("of", file.layout->total_parts)});

  if (file.window->Done()) {
    CompleteMultipart(id);
    return;
  }
  Dispatch(id);
}

void CompletionCoordinator::CompleteMultipart(model::FileId id) {
  auto& file = Entry(id);
  SetStatus(id, UploadStatus::kMultipartCompletionInProgress);

  if (file.progress.uploaded_bytes != file.info.size) {
    util::ConsistencyError mismatch(
        fmt::format("Uploaded size: {}, file size: {}, does not match", file.progress.uploaded_bytes, file.info.size));
    Fail(id, mismatch.what());
    return;
  }

  auto parts = file.progress.parts;
  std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) { return a.part_number < b.part_number; });

  observability::SpanScope span("upload.complete_multipart");
  span.SetAttribute("path", file.info.path);
  try {
    store_->CompleteMultipartUpload(file.destination, file.progress.upload_id, parts);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    Fail(id, std::string("complete multipart upload: ") + e.what());
    return;
  }

  file.checkpoint->Delete();
  ReleaseIfIdle(file);
  SetStatus(id, UploadStatus::kUploadCompleted);
  UPLOAD_LOG_INFO("multipart upload completed", {StringField("path", file.info.path), StringField("upload_id", file.progress.upload_id),
                                                 IntField("parts", static_cast<std::int64_t>(parts.size()))});
}

void CompletionCoordinator::OnCancel() {
  cancel_handled_ = true;

  auto pending = pool_.DrainPending();
  for (const auto& task : pending) {
    auto& file = Entry(task.file_id);
    --outstanding_tasks_;
    --file.in_flight;
    if (file.window) file.window->Abandon(task.part_number);
  }

  for (model::FileId id = 0; id < files_.size(); ++id) {
    auto& file = files_[id];
    if (!file.known) continue;
    if (model::IsTerminal(file.info.status)) {
      ReleaseIfIdle(file);
      continue;
    }
    // files still being planned are failed when their plan arrives
    if (file.info.status == UploadStatus::kUnprocessed) continue;
    Fail(id, util::Cancelled().what());
  }

  UPLOAD_LOG_WARN("upload cancelled", {IntField("dropped_tasks", static_cast<std::int64_t>(pending.size()))});
}

void CompletionCoordinator::SetStatus(model::FileId id, UploadStatus status, std::optional<std::uint64_t> total,
                                      std::optional<std::uint64_t> uploaded_bytes) {
  auto& file       = Entry(id);
  auto  previous   = file.info.status;
  file.info.status = status;

  if (!model::IsTerminal(previous) && model::IsTerminal(status)) {
    ++terminal_;
    observability::Metrics::Instance().RecordFileOutcome(model::ToString(status));
    if (options_.on_terminal) options_.on_terminal(id);
  }

  monitor_.Post(progress::StatusChange{id, status, total, uploaded_bytes});
}

void CompletionCoordinator::Fail(model::FileId id, const std::string& error) {
  auto& file = Entry(id);
  if (model::IsTerminal(file.info.status)) return;

  file.error = error;
  UPLOAD_LOG_ERROR("upload failed", {StringField("path", file.info.path), StringField("error", error)});

  // parts of this file still waiting for a worker would only be discarded
  auto dropped = pool_.DrainPending(id);
  outstanding_tasks_ -= dropped.size();
  file.in_flight -= static_cast<int>(dropped.size());
  if (!dropped.empty()) {
    UPLOAD_LOG_DEBUG("dropped queued parts of failed file", {StringField("path", file.info.path),
                                                             IntField("parts", static_cast<std::int64_t>(dropped.size()))});
  }

  SetStatus(id, UploadStatus::kUploadFailed);
  ReleaseIfIdle(file);
}

void CompletionCoordinator::ReleaseIfIdle(FileEntry& file) {
  if (file.in_flight > 0 || !file.reader) return;

  try {
    file.reader->Close();
  } catch (const std::exception& e) {
    UPLOAD_LOG_WARN("closing file failed", {StringField("path", file.info.path), StringField("error", e.what())});
  }
  file.reader.reset();
}

engine::RunReport CompletionCoordinator::BuildReport() const {
  engine::RunReport report;
  for (const auto& file : files_) {
    if (!file.known) continue;
    report.files.push_back(engine::FileOutcome{file.info.path, file.info.status, file.info.size, file.info.uploaded_bytes, file.error});
  }
  return report;
}

} // namespace upload::completion
