#include "part_layout.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace upload::scheduler {

std::uint64_t PartLayout::Offset(int part_number) const {
  if (part_number < 1 || part_number > total_parts) {
    throw util::InvalidArgument("part " + std::to_string(part_number) + " outside 1.." + std::to_string(total_parts));
  }
  return static_cast<std::uint64_t>(part_number - 1) * part_size;
}

std::uint64_t PartLayout::Length(int part_number) const {
  if (part_number < 1 || part_number > total_parts) {
    throw util::InvalidArgument("part " + std::to_string(part_number) + " outside 1.." + std::to_string(total_parts));
  }
  return part_number == total_parts ? last_part_size : part_size;
}

PartLayout ComputePartLayout(std::uint64_t file_size, std::uint64_t part_size) {
  if (part_size == 0) {
    throw util::PlanningError("part size must be positive");
  }
  if (file_size == 0) {
    throw util::PlanningError("multipart upload of an empty file");
  }
  if (file_size > kMaxMultipartObject) {
    throw util::PlanningError("file size " + std::to_string(file_size) + " exceeds the 5 TiB multipart object limit");
  }

  auto parts = (file_size + part_size - 1) / part_size;
  if (parts > static_cast<std::uint64_t>(kMaxParts)) {
    throw util::PlanningError("file size " + std::to_string(file_size) + " needs " + std::to_string(parts) + " parts of " +
                              std::to_string(part_size) + " bytes; the limit is " + std::to_string(kMaxParts));
  }

  PartLayout layout;
  layout.file_size      = file_size;
  layout.part_size      = part_size;
  layout.total_parts    = static_cast<int>(parts);
  layout.last_part_size = file_size - (parts - 1) * part_size;
  return layout;
}

} // namespace upload::scheduler
