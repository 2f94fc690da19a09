#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

/*
    StopToken / StopSource carry the global stop request (SIGINT in fsplay) to every thread.

    The app owns the StopSource. Loader lanes, the audio thread and the playback loop each get a
    read-only StopToken. Nothing inside the pipeline requests a global stop on its own: a lane that
    fails or a scheduler that aborts only ends its own thread.

    request_stop() is called from a signal handler, so the flag has to be a lock-free atomic.
*/

namespace fsp {

static_assert(std::atomic_bool::is_always_lock_free, "stop flag must be usable from a signal handler");

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_relaxed);
  }

  // Sleeps for 'd' in short slices. Returns early (true) once a stop is requested
  template <typename Rep, typename Period>
  bool sleep_for(const std::chrono::duration<Rep, Period>& d) const {
    constexpr auto kSlice = std::chrono::milliseconds(10);
    const auto deadline = std::chrono::steady_clock::now() + d;
    while (!stop_requested()) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) return false;
      std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSlice, deadline - now));
    }
    return true;
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopToken token() const { return StopToken(&stop_); }

  void request_stop() { stop_.store(true, std::memory_order_relaxed); }

  bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
  std::atomic_bool stop_{false};
};

} // namespace fsp
