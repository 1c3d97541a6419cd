#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace upload::transfer {

/*
  Thread-safe blocking queue (many producers, many consumers).

  A capacity of 0 means unbounded; otherwise Push() waits for room.
  After Close() pushes are refused and consumers drain what is left,
  then Pop() returns nullopt.
*/
template <typename T>
class BlockingQueue {
 public:
  explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {
  }

  // false once closed
  bool Push(T item) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock, [&] { return closed_ || capacity_ == 0 || queue_.size() < capacity_; });
      if (closed_) return false;
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

    return TakeLocked();
  }

  // nullopt on timeout, or when closed and drained
  template <typename Rep, typename Period>
  std::optional<T> PopFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);

    cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

    return TakeLocked();
  }

  std::optional<T> TryPop() {
    std::lock_guard lock(mutex_);
    return TakeLocked();
  }

  // Removes everything still queued without closing.
  std::vector<T> Drain() {
    return RemoveIf([](const T&) { return true; });
  }

  // Removes the queued items matching pred, keeping the order of the rest.
  template <typename Pred>
  std::vector<T> RemoveIf(Pred pred) {
    std::vector<T> removed;
    {
      std::lock_guard lock(mutex_);
      auto            keep = std::stable_partition(queue_.begin(), queue_.end(), [&](const T& item) { return !pred(item); });
      removed.assign(std::make_move_iterator(keep), std::make_move_iterator(queue_.end()));
      queue_.erase(keep, queue_.end());
    }
    if (!removed.empty()) not_full_.notify_all();
    return removed;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
    not_full_.notify_all();
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  std::optional<T> TakeLocked() {
    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return item;
  }

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable not_full_;
  std::deque<T>           queue_;
  std::size_t             capacity_;
  bool                    closed_ = false;
};

} // namespace upload::transfer
