#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "internal/storage/object_store.hpp"

namespace upload::checkpoint {

/*
  Progress of one outstanding multipart upload.

  parts is kept in completion order; callers sort before completing.
  uploaded_bytes always equals the sum of parts[i].size.
*/
struct Checkpoint {
  std::string                        upload_id;
  std::uint64_t                      uploaded_bytes = 0;
  std::uint64_t                      part_size      = 0;
  std::vector<storage::UploadedPart> parts;

  std::set<int> PartNumbers() const {
    std::set<int> numbers;
    for (const auto& part : parts) {
      numbers.insert(part.part_number);
    }
    return numbers;
  }
};

} // namespace upload::checkpoint
