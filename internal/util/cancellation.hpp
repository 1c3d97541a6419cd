#pragma once

#include <atomic>

namespace upload::util {

/*
  Single cancellation signal shared by the planner, the dispatch loop and
  every worker. Observers poll; nothing blocks on it.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace upload::util
