#include "upload_engine.hpp"

#include <algorithm>

#include "internal/completion/completion_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/transfer/worker_pool.hpp"
#include "internal/util/errors.hpp"

namespace upload::engine {

using observability::BytesField;
using observability::IntField;

namespace {

planner::PlannerOptions ToPlannerOptions(const EngineOptions& options) {
  planner::PlannerOptions planner_options;
  planner_options.part_size           = options.part_size;
  planner_options.multipart_threshold = options.multipart_threshold;
  planner_options.record_tag_key      = options.record_tag_key;
  return planner_options;
}

std::size_t AdmissionCapacity(const EngineOptions& options) {
  return options.max_active_files > 0 ? options.max_active_files : 2 * std::max<std::size_t>(options.threads, 1);
}

} // namespace

UploadEngine::UploadEngine(EngineOptions options, storage::ObjectStorePtr store, std::shared_ptr<checkpoint::CheckpointStore> checkpoints,
                           std::shared_ptr<progress::ProgressMonitor> monitor)
    : options_(std::move(options)),
      store_(std::move(store)),
      checkpoints_(std::move(checkpoints)),
      monitor_(std::move(monitor)),
      planner_(store_, checkpoints_, ToPlannerOptions(options_)),
      admission_(AdmissionCapacity(options_)) {
  if (options_.threads == 0) {
    throw util::InvalidArgument("threads must be at least 1");
  }
  if (options_.window_bytes == 0) {
    throw util::InvalidArgument("window size must be positive");
  }
  if (!monitor_) {
    monitor_ = std::make_shared<progress::ProgressMonitor>(progress::MonitorOptions{true});
  }
}

UploadEngine::~UploadEngine() = default;

void UploadEngine::Cancel() {
  cancel_.Cancel();
  admission_.Wake();

  std::lock_guard lock(coordinator_mutex_);
  if (coordinator_) {
    coordinator_->Post(completion::CancelRequested{});
  }
}

RunReport UploadEngine::Run(const std::vector<planner::UploadRequest>& requests) {
  if (ran_) {
    throw util::InvalidArgument("an upload engine runs once");
  }
  ran_ = true;

  observability::SpanScope span("upload.run");
  span.SetAttribute("files", static_cast<std::int64_t>(requests.size()));
  UPLOAD_LOG_INFO("upload run starting", {IntField("files", static_cast<std::int64_t>(requests.size())),
                                          IntField("threads", static_cast<std::int64_t>(options_.threads)),
                                          BytesField("part_size", options_.part_size)});

  std::unique_ptr<completion::CompletionCoordinator> coordinator;

  transfer::WorkerPool pool(
      options_.threads, store_, [&coordinator](transfer::TaskResult result) { coordinator->Post(std::move(result)); },
      [monitor = monitor_.get()](model::FileId id, std::uint64_t delta) { monitor->Post(progress::UpdateBytes{id, delta}); }, cancel_);

  completion::CoordinatorOptions coordinator_options;
  coordinator_options.window_bytes = options_.window_bytes;
  coordinator_options.on_terminal  = [this](model::FileId) { admission_.Leave(); };
  coordinator = std::make_unique<completion::CompletionCoordinator>(store_, pool, *monitor_, std::move(coordinator_options), cancel_);
  {
    std::lock_guard lock(coordinator_mutex_);
    coordinator_ = coordinator.get();
  }

  monitor_->Start();
  coordinator->Start();
  pool.Start();

  // a Cancel() that raced the registration above still needs to wake the coordinator
  if (cancel_.IsCancelled()) {
    coordinator->Post(completion::CancelRequested{});
  }

  for (std::size_t i = 0; i < requests.size(); ++i) {
    const auto& request = requests[i];
    auto        id      = static_cast<model::FileId>(i);
    // counted in before it is announced, so its terminal status always has a slot to give back
    bool admitted = admission_.Enter(cancel_);
    coordinator->Post(completion::FileDiscovered{id, request.path});

    if (!admitted || cancel_.IsCancelled()) {
      coordinator->Post(completion::FileRejected{id, util::Cancelled().what()});
      continue;
    }

    try {
      coordinator->Post(completion::FilePlanned{id, planner_.Plan(request, cancel_)});
    } catch (const std::exception& e) {
      coordinator->Post(completion::FileRejected{id, e.what()});
    }
  }
  coordinator->Post(completion::SubmissionsClosed{});

  auto report = coordinator->Wait();

  // every task has produced its result, so the workers are idle
  pool.Stop();
  {
    std::lock_guard lock(coordinator_mutex_);
    coordinator_ = nullptr;
  }
  monitor_->Stop();

  UPLOAD_LOG_INFO("upload run finished", {IntField("completed", static_cast<std::int64_t>(report.Count(model::UploadStatus::kUploadCompleted))),
                                          IntField("skipped", static_cast<std::int64_t>(report.Count(model::UploadStatus::kPreviouslyUploaded))),
                                          IntField("failed", static_cast<std::int64_t>(report.Failed()))});
  return report;
}

} // namespace upload::engine
