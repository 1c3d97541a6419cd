#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/model/destination.hpp"
#include "internal/model/file_info.hpp"
#include "internal/scheduler/part_layout.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/sha256.hpp"

namespace upload::planner {

/*
  A resolved input: a local path plus where it goes.

  Either upload_url (pre-signed) or destination must be set. local and
  remote are optional; a missing local identity is computed from disk and
  a missing remote entry means "not in the catalog".
*/
struct UploadRequest {
  std::string                       path;
  std::string                       upload_url;
  std::optional<model::Destination> destination;
  std::optional<util::LocalFile>    local;
  std::optional<util::LocalFile>    remote;
};

struct PlannerOptions {
  std::uint64_t part_size           = 128ULL * 1024 * 1024;
  std::uint64_t multipart_threshold = 128ULL * 1024 * 1024;
  std::string   record_tag_key      = "X-COS-RECORD-ID";
};

struct SkipPlan {};

struct SinglePlan {};

struct MultipartPlan {
  scheduler::PartLayout           layout;
  // resume baseline; parts empty for a fresh upload
  checkpoint::Checkpoint          baseline;
  checkpoint::CheckpointHandlePtr handle;
};

struct FilePlan {
  model::FileInfo                                   info;
  model::Destination                                destination;
  std::variant<SkipPlan, SinglePlan, MultipartPlan> kind;
};

/*
  Decides how each file travels.

      remote hash+size match        → SkipPlan
      size <= multipart_threshold   → SinglePlan
      otherwise                     → MultipartPlan, resumed from a
                                      checkpoint the store still agrees with,
                                      or a new upload id

  Runs on the submitting thread and may block on ListParts and
  InitiateMultipartUpload. Every failure surfaces as util::PlanningError,
  except util::Cancelled.
*/
class UploadPlanner {
 public:
  UploadPlanner(storage::ObjectStorePtr store, std::shared_ptr<checkpoint::CheckpointStore> checkpoints, PlannerOptions options);

  FilePlan Plan(const UploadRequest& request, const util::CancellationToken& cancel) const;

 private:
  MultipartPlan PlanMultipart(const model::FileInfo& info, const model::Destination& destination, const util::CancellationToken& cancel) const;

  // The checkpoint when the store still holds every part it lists; nullopt when stale.
  std::optional<checkpoint::Checkpoint> Reconcile(checkpoint::CheckpointHandle& handle, const model::Destination& destination,
                                                  const scheduler::PartLayout& layout) const;

  storage::ObjectStorePtr                      store_;
  std::shared_ptr<checkpoint::CheckpointStore> checkpoints_;
  PlannerOptions                               options_;
};

} // namespace upload::planner
