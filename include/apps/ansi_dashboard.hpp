#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"

namespace fsp {

struct QueueView {
  std::string name;
  std::function<std::size_t()> size_fn;
  std::function<std::size_t()> cap_fn;
  std::function<std::uint64_t()> high_water_fn;
};

// Terminal view of lane throughput, phase timings and queue fill
class AnsiDashboard {
public:
  AnsiDashboard(Metrics& metrics,
                std::vector<QueueView> queues,
                std::function<std::uint64_t()> playback_cursor,
                std::uint64_t total_frames,
                int refresh_ms);

  void run(const StopToken& stop, const std::atomic_bool& local_stop);

private:
  Metrics& metrics_;
  std::vector<QueueView> queues_;
  std::function<std::uint64_t()> playback_cursor_;
  std::uint64_t total_frames_;
  int refresh_ms_;

  struct Prev { std::uint64_t count{0}; std::uint64_t work_ns{0}; };
  std::unordered_map<const StageMetrics*, Prev> prev_stage_;
};

} // namespace fsp
