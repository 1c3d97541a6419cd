#pragma once

#include <cstdint>

namespace upload::scheduler {

inline constexpr int           kMaxParts           = 10000;
inline constexpr std::uint64_t kMaxMultipartObject = 5ULL * 1024 * 1024 * 1024 * 1024;

/*
  Deterministic split of a file into parts numbered 1..total_parts.
  Every part is part_size bytes except the last, which holds the remainder.
*/
struct PartLayout {
  std::uint64_t file_size      = 0;
  std::uint64_t part_size      = 0;
  int           total_parts    = 0;
  std::uint64_t last_part_size = 0;

  std::uint64_t Offset(int part_number) const;
  std::uint64_t Length(int part_number) const;
};

// Throws util::PlanningError for an empty file, a zero part size, or a layout beyond S3 limits.
PartLayout ComputePartLayout(std::uint64_t file_size, std::uint64_t part_size);

} // namespace upload::scheduler
