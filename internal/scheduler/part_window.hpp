#pragma once

#include <cstdint>
#include <optional>
#include <set>

namespace upload::scheduler {

/*
  Bounds how far ahead of the oldest outstanding part a file may dispatch.

  With W = min(max(window_bytes, part_size) / part_size, total_parts), part p may start only
  when nothing is in flight or p < min(in_flight) + W, so at most W parts
  of one file are ever in flight. The minimum is recomputed after every
  completion.

  Candidates are taken in ascending order, skipping parts already
  completed (seeded from a checkpoint) or in flight.

  Owned by a single thread; no locking.
*/
class PartWindow {
 public:
  PartWindow(int total_parts, std::uint64_t part_size, std::uint64_t window_bytes, const std::set<int>& completed = {});

  int WindowParts() const {
    return window_parts_;
  }

  // Next dispatchable part, marked in flight; nullopt when the window is full or nothing is left.
  std::optional<int> Next();

  // Moves part_number from in flight to completed.
  void MarkCompleted(int part_number);

  // Drops part_number from in flight without completing it.
  void Abandon(int part_number);

  bool CanDispatch() const;

  bool Done() const {
    return static_cast<int>(completed_.size()) == total_parts_;
  }

  bool HasPending() const;

  std::size_t InFlight() const {
    return in_flight_.size();
  }

  std::size_t Completed() const {
    return completed_.size();
  }

  std::optional<int> MinInFlight() const;

 private:
  void AdvanceCursor();

  int           total_parts_;
  int           window_parts_;
  std::set<int> in_flight_;
  std::set<int> completed_;

  // smallest part number that is neither completed nor in flight (total_parts_ + 1 when none)
  int cursor_ = 1;
};

} // namespace upload::scheduler
