#include "upload_planner.hpp"

#include <filesystem>
#include <map>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/url/presigned_url.hpp"
#include "internal/util/errors.hpp"

namespace upload::planner {

using observability::IntField;
using observability::StringField;

namespace {

std::string_view Unquote(std::string_view etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

model::Destination ResolveDestination(const UploadRequest& request) {
  if (request.destination) {
    return *request.destination;
  }
  if (request.upload_url.empty()) {
    throw util::PlanningError("no upload url for " + request.path);
  }
  try {
    return url::ParsePresignedUrl(request.upload_url);
  } catch (const util::InvalidArgument& e) {
    throw util::PlanningError(e.what());
  }
}

} // namespace

UploadPlanner::UploadPlanner(storage::ObjectStorePtr store, std::shared_ptr<checkpoint::CheckpointStore> checkpoints, PlannerOptions options)
    : store_(std::move(store)), checkpoints_(std::move(checkpoints)), options_(std::move(options)) {
  if (options_.part_size == 0) {
    throw util::InvalidArgument("part size must be positive");
  }
}

FilePlan UploadPlanner::Plan(const UploadRequest& request, const util::CancellationToken& cancel) const {
  if (cancel.IsCancelled()) throw util::Cancelled();

  FilePlan plan;
  plan.destination = ResolveDestination(request);

  auto local       = request.local ? *request.local : util::HashLocalFile(request.path);
  plan.info.path   = request.path;
  plan.info.size   = local.size;
  plan.info.sha256 = local.sha256;

  if (request.remote && request.remote->sha256 == local.sha256 && request.remote->size == local.size) {
    UPLOAD_LOG_INFO("previously uploaded, skipping", {StringField("path", request.path)});
    plan.info.status = model::UploadStatus::kPreviouslyUploaded;
    plan.kind        = SkipPlan{};
    return plan;
  }

  // the file itself is opened by the coordinator when its first task is dispatched
  std::error_code ec;
  auto            on_disk = std::filesystem::file_size(request.path, ec);
  if (ec) {
    throw util::PlanningError("stat " + request.path + ": " + ec.message());
  }
  if (on_disk != local.size) {
    throw util::PlanningError("size of " + request.path + " changed since it was hashed: " + std::to_string(local.size) + " -> " +
                              std::to_string(on_disk));
  }

  plan.info.status = model::UploadStatus::kUploadInProgress;
  if (local.size <= options_.multipart_threshold) {
    plan.kind = SinglePlan{};
    return plan;
  }

  auto multipart           = PlanMultipart(plan.info, plan.destination, cancel);
  plan.info.uploaded_bytes = multipart.baseline.uploaded_bytes;
  plan.kind                = std::move(multipart);
  return plan;
}

MultipartPlan UploadPlanner::PlanMultipart(const model::FileInfo& info, const model::Destination& destination,
                                           const util::CancellationToken& cancel) const {
  MultipartPlan plan;
  plan.layout = scheduler::ComputePartLayout(info.size, options_.part_size);

  auto record_id = url::RecordId(destination, options_.record_tag_key);
  plan.handle    = checkpoints_->Open(record_id, info.sha256, info.path);

  if (auto checkpoint = Reconcile(*plan.handle, destination, plan.layout)) {
    UPLOAD_LOG_INFO("resuming multipart upload", {StringField("path", info.path), StringField("upload_id", checkpoint->upload_id),
                                                  IntField("parts_done", static_cast<std::int64_t>(checkpoint->parts.size())),
                                                  IntField("parts_total", plan.layout.total_parts)});
    plan.baseline = std::move(*checkpoint);
    return plan;
  }

  if (cancel.IsCancelled()) throw util::Cancelled();

  plan.baseline           = checkpoint::Checkpoint{};
  plan.baseline.part_size = plan.layout.part_size;
  try {
    plan.baseline.upload_id = store_->InitiateMultipartUpload(destination);
  } catch (const std::exception& e) {
    throw util::PlanningError("unable to start multipart upload for " + info.path + ": " + e.what());
  }

  UPLOAD_LOG_INFO("starting multipart upload", {StringField("path", info.path), StringField("upload_id", plan.baseline.upload_id),
                                                IntField("parts_total", plan.layout.total_parts)});
  return plan;
}

std::optional<checkpoint::Checkpoint> UploadPlanner::Reconcile(checkpoint::CheckpointHandle& handle, const model::Destination& destination,
                                                               const scheduler::PartLayout& layout) const {
  auto discard = [&](std::string_view reason) -> std::optional<checkpoint::Checkpoint> {
    UPLOAD_LOG_WARN("discarding stale checkpoint", {StringField("checkpoint", handle.Path().string()), StringField("reason", reason)});
    handle.Delete();
    return std::nullopt;
  };

  std::optional<checkpoint::Checkpoint> checkpoint;
  try {
    checkpoint = handle.Load();
  } catch (const std::exception& e) {
    return discard(e.what());
  }
  if (!checkpoint) {
    if (handle.Exists()) {
      return discard("no upload id recorded");
    }
    return std::nullopt;
  }

  if (checkpoint->part_size != layout.part_size) {
    return discard("recorded with part size " + std::to_string(checkpoint->part_size));
  }

  std::vector<storage::RemotePart> remote;
  try {
    remote = store_->ListParts(destination, checkpoint->upload_id);
  } catch (const std::exception& e) {
    return discard(std::string("list parts failed: ") + e.what());
  }
  if (remote.empty()) {
    return discard("store reports no parts for upload " + checkpoint->upload_id);
  }

  std::map<int, std::string_view> remote_etags;
  for (const auto& part : remote) {
    remote_etags[part.part_number] = Unquote(part.etag);
  }

  for (const auto& part : checkpoint->parts) {
    if (part.part_number < 1 || part.part_number > layout.total_parts) {
      return discard("part " + std::to_string(part.part_number) + " outside the file layout");
    }
    if (part.size != layout.Length(part.part_number)) {
      return discard("part " + std::to_string(part.part_number) + " has unexpected size");
    }
    auto it = remote_etags.find(part.part_number);
    if (it == remote_etags.end() || it->second != Unquote(part.etag)) {
      return discard("part " + std::to_string(part.part_number) + " not held by the store");
    }
  }

  return checkpoint;
}

} // namespace upload::planner
