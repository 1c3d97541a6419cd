#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/model/destination.hpp"
#include "internal/model/file_info.hpp"
#include "internal/storage/file_source.hpp"
#include "internal/storage/object_store.hpp"

namespace upload::transfer {

/*
  One unit of network work: a whole file (single PUT) or one part.

  Created by the engine, consumed exactly once by a worker. For a
  single-shot upload upload_id is empty and part_number is 0.
*/
struct UploadTask {
  model::FileId      file_id = 0;
  std::string        path;
  model::Destination destination;

  std::optional<std::string> upload_id;
  int                        part_number = 0;
  int                        total_parts = 1;

  std::uint64_t offset = 0;
  std::uint64_t length = 0;

  std::shared_ptr<storage::FileSource> reader;
  checkpoint::CheckpointHandlePtr      checkpoint;

  bool IsMultipart() const {
    return upload_id.has_value();
  }
};

/*
  Outcome of one UploadTask. Workers never touch file state; the
  completion coordinator applies results one at a time.
*/
struct TaskResult {
  model::FileId file_id     = 0;
  int           part_number = 0;

  // set for a successful multipart part
  std::optional<storage::UploadedPart> part;

  // empty on success
  std::string error;
  bool        cancelled = false;

  bool Ok() const {
    return error.empty();
  }
};

} // namespace upload::transfer
