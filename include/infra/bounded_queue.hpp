#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

/*
    Bounded FIFO used as a lane queue: one loader thread pushes, the playback scheduler pops.

    - try_push never lets the queue grow past capacity, a full queue refuses the item
    - try_pop never blocks, it tells the caller whether the queue was empty or the
      producer has closed it for good
    - wait_for_space is the producer's bounded backpressure wait
*/

namespace fsp {

enum class PopStatus {
  kOk,
  kEmpty,        // nothing buffered yet, producer still alive
  kDisconnected  // nothing buffered and the producer closed the queue
};

template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity): capacity_(capacity) {}

  // No copy/move
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Returns false when full or closed, 'item' is left untouched in that case
  bool try_push(T& item) {
    std::unique_lock<std::mutex> lock(mu_);

    if (closed_ || q_.size() >= capacity_) {
      ++refused_;
      return false;
    }

    q_.push_back(std::move(item));
    ++pushes_;
    high_water_ = std::max(high_water_, q_.size());
    lock.unlock();
    data_cv_.notify_one();
    return true;
  }

  PopStatus try_pop(T& out) {
    std::unique_lock<std::mutex> lock(mu_);

    if (q_.empty()) return closed_ ? PopStatus::kDisconnected : PopStatus::kEmpty;

    out = std::move(q_.front());
    q_.pop_front();
    ++pops_;

    lock.unlock();
    space_cv_.notify_one();
    return PopStatus::kOk;
  }

  // Timeout variant of Pop function
  template <typename Rep, typename Period>
  PopStatus try_pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    data_cv_.wait_for(lock, timeout, [&] { return !q_.empty() || closed_; });
    if (q_.empty()) return closed_ ? PopStatus::kDisconnected : PopStatus::kEmpty;

    out = std::move(q_.front());
    q_.pop_front();
    ++pops_;

    lock.unlock();
    space_cv_.notify_one();
    return PopStatus::kOk;
  }

  // Waits up to 'timeout' for the queue to drop below capacity. Returns true if there is room
  template <typename Rep, typename Period>
  bool wait_for_space(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return space_cv_.wait_for(lock, timeout, [&] { return q_.size() < capacity_ || closed_; }) && !closed_;
  }

  // Producer is done. Buffered items can still be popped
  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    data_cv_.notify_all();
    space_cv_.notify_all();
  }

  // Getters

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

  std::size_t capacity() const { return capacity_; }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::uint64_t pushes_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pushes_;
  }

  std::uint64_t pops_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pops_;
  }

  std::uint64_t refused_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return refused_;
  }

  // Largest size ever observed
  std::size_t high_water() const {
    std::lock_guard<std::mutex> lock(mu_);
    return high_water_;
  }

private:
  const std::size_t capacity_;

  mutable std::mutex mu_;
  std::condition_variable data_cv_;
  std::condition_variable space_cv_;
  std::deque<T> q_;
  bool closed_{false};

  std::uint64_t pushes_{0};
  std::uint64_t pops_{0};
  std::uint64_t refused_{0};
  std::size_t high_water_{0};
};

} // namespace fsp
