#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/*
  Metrics owns one StageMetrics per loader lane plus one for playback. Each StageMetrics is written by
  a single thread and read by the dashboard. NowNs/NowMs wrap the steady clock in integer form.
*/

namespace fsp {

using SteadyClock = std::chrono::steady_clock;

inline std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

inline std::uint64_t NowMs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

struct StageMetrics {
  std::string name;

  std::atomic<std::uint64_t> count{0};
  std::atomic<std::uint64_t> avg_latency_ns{0};
  std::atomic<std::uint64_t> last_event_ns{0};

  std::atomic<std::uint64_t> work_ns_total{0};

  // Loader phase totals, playback leaves them at zero
  std::atomic<std::uint64_t> io_ns_total{0};
  std::atomic<std::uint64_t> decode_ns_total{0};
  std::atomic<std::uint64_t> resize_ns_total{0};

  // Playback only
  std::atomic<std::uint64_t> underruns{0};
  std::atomic<std::uint64_t> avg_queue_wait_ns{0}; // loader ready -> presented

  explicit StageMetrics(std::string n) : name(std::move(n)) {
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_item(std::uint64_t latency_ns) {
    count.fetch_add(1, std::memory_order_relaxed);

    auto prev = avg_latency_ns.load(std::memory_order_relaxed);
    auto next = (prev == 0) ? latency_ns : (prev * 7 + latency_ns) / 8;
    avg_latency_ns.store(next, std::memory_order_relaxed);

    work_ns_total.fetch_add(latency_ns, std::memory_order_relaxed);
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_phases(std::uint64_t io_ns, std::uint64_t decode_ns, std::uint64_t resize_ns) {
    io_ns_total.fetch_add(io_ns, std::memory_order_relaxed);
    decode_ns_total.fetch_add(decode_ns, std::memory_order_relaxed);
    resize_ns_total.fetch_add(resize_ns, std::memory_order_relaxed);
    on_item(io_ns + decode_ns + resize_ns);
  }

  void on_underrun() {
    underruns.fetch_add(1, std::memory_order_relaxed);
  }

  void on_queue_wait(std::uint64_t wait_ns) {
    auto prev = avg_queue_wait_ns.load(std::memory_order_relaxed);
    avg_queue_wait_ns.store((prev == 0) ? wait_ns : (prev * 7 + wait_ns) / 8, std::memory_order_relaxed);
  }
};

class Metrics {
public:
  StageMetrics* make_stage(std::string name) {
    stages_.push_back(std::make_unique<StageMetrics>(std::move(name)));
    return stages_.back().get();
  }

  const std::vector<std::unique_ptr<StageMetrics>>& stages() const { return stages_; }

private:
  std::vector<std::unique_ptr<StageMetrics>> stages_;
};

} // namespace fsp
