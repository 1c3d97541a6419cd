#include "part_window.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace upload::scheduler {

PartWindow::PartWindow(int total_parts, std::uint64_t part_size, std::uint64_t window_bytes, const std::set<int>& completed)
    : total_parts_(total_parts) {
  if (total_parts < 1) {
    throw util::InvalidArgument("part window needs at least one part");
  }
  if (part_size == 0) {
    throw util::InvalidArgument("part window needs a positive part size");
  }

  // never wider than the file, so the narrowing below cannot wrap
  window_parts_ = static_cast<int>(std::min<std::uint64_t>(std::max(window_bytes, part_size) / part_size, static_cast<std::uint64_t>(total_parts_)));

  for (int part : completed) {
    if (part < 1 || part > total_parts_) {
      throw util::InvalidArgument("completed part " + std::to_string(part) + " outside 1.." + std::to_string(total_parts_));
    }
    completed_.insert(part);
  }
  AdvanceCursor();
}

void PartWindow::AdvanceCursor() {
  while (cursor_ <= total_parts_ && (completed_.count(cursor_) > 0 || in_flight_.count(cursor_) > 0)) {
    ++cursor_;
  }
}

bool PartWindow::HasPending() const {
  return cursor_ <= total_parts_;
}

std::optional<int> PartWindow::MinInFlight() const {
  if (in_flight_.empty()) return std::nullopt;
  return *in_flight_.begin();
}

bool PartWindow::CanDispatch() const {
  if (!HasPending()) return false;
  if (in_flight_.empty()) return true;
  return cursor_ - *in_flight_.begin() < window_parts_;
}

std::optional<int> PartWindow::Next() {
  if (!CanDispatch()) {
    return std::nullopt;
  }

  int part = cursor_;
  in_flight_.insert(part);
  AdvanceCursor();
  return part;
}

void PartWindow::MarkCompleted(int part_number) {
  if (in_flight_.erase(part_number) == 0) {
    throw util::InvalidArgument("part " + std::to_string(part_number) + " completed but was not in flight");
  }
  completed_.insert(part_number);
}

void PartWindow::Abandon(int part_number) {
  if (in_flight_.erase(part_number) == 0) {
    return;
  }
  cursor_ = std::min(cursor_, part_number);
}

} // namespace upload::scheduler
