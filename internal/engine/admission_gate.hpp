#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "internal/util/cancellation.hpp"

namespace upload::engine {

/*
  Caps how many files are between planning and a terminal status.

  Enter() counts a file in, waiting while the gate is full. Once the
  token is cancelled it stops waiting and still counts the file, so every
  Enter() is matched by exactly one Leave() when the file finishes.
*/
class AdmissionGate {
 public:
  explicit AdmissionGate(std::size_t capacity) : capacity_(capacity) {
  }

  // false when admission was cut short by cancellation
  bool Enter(const util::CancellationToken& cancel) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return active_ < capacity_ || cancel.IsCancelled(); });
    ++active_;
    return !cancel.IsCancelled();
  }

  void Leave() {
    {
      std::lock_guard lock(mutex_);
      if (active_ > 0) --active_;
    }
    cv_.notify_one();
  }

  // re-evaluates waiters, e.g. after the token fired
  void Wake() {
    std::lock_guard lock(mutex_);
    cv_.notify_all();
  }

  std::size_t Active() const {
    std::lock_guard lock(mutex_);
    return active_;
  }

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::size_t             capacity_;
  std::size_t             active_ = 0;
};

} // namespace upload::engine
