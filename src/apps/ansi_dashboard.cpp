#include "apps/ansi_dashboard.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <utility>

namespace fsp {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kRed   = "\033[31m";
static constexpr const char* kGreen = "\033[32m";
static constexpr const char* kYellow= "\033[33m";

static double NsToMs(std::uint64_t ns) { return static_cast<double>(ns) / 1e6; }

// Fill a simple bar based on ratio of used/cap
static std::string Bar(std::size_t used, std::size_t cap, std::size_t width) {
  if (cap == 0) return std::string(width, '.');
  const double frac = static_cast<double>(used) / static_cast<double>(cap);

  const std::size_t filled = static_cast<std::size_t>(frac * width);
  std::string s;
  s.reserve(width);
  for (std::size_t i = 0; i < width; ++i) s.push_back(i < filled ? 'I' : '_');
  return s;
}

AnsiDashboard::AnsiDashboard(Metrics& metrics, std::vector<QueueView> queues, std::function<std::uint64_t()> playback_cursor, std::uint64_t total_frames, int refresh_ms)
    : metrics_(metrics), queues_(std::move(queues)), playback_cursor_(std::move(playback_cursor)), total_frames_(total_frames), refresh_ms_(refresh_ms) {}

// Redraws every refresh_ms. Per stage: FPS, busy %, average latency, staleness and the
// average io/decode/resize split for loader lanes, underruns and queue wait for playback
void AnsiDashboard::run(const StopToken& stop, const std::atomic_bool& local_stop) {
  using namespace std::chrono;

  std::cout << "\033[2J\033[H" << std::flush;

  auto last = steady_clock::now();

  while (!stop.stop_requested() && !local_stop.load(std::memory_order_relaxed)) {
    if (stop.sleep_for(milliseconds(refresh_ms_))) break;

    const auto now = steady_clock::now();
    const double dt = duration_cast<duration<double>>(now - last).count();
    last = now;

    const auto now_ns = NowNs();
    const std::uint64_t shown = playback_cursor_ ? playback_cursor_() : 0;

    std::cout << "\033[H";
    std::cout << "FRAME STREAM\n";
    std::cout << "frame " << shown << "/" << total_frames_ << "\n\n";

    std::cout << std::left
              << std::setw(12) << "STAGE"
              << std::setw(9) << "FPS"
              << std::setw(9) << "BUSY%"
              << std::setw(10) << "LAT(ms)"
              << std::setw(10) << "LAST(ms)"
              << std::setw(10) << "IO(ms)"
              << std::setw(10) << "DEC(ms)"
              << std::setw(10) << "RSZ(ms)"
              << std::setw(8) << "UNDER"
              << std::setw(10) << "WAIT(ms)"
              << "\n";
    std::cout << std::string(12 + 9 + 9 + 10 * 6 + 8, '-') << "\n";

    for (const auto& up : metrics_.stages()) {
      const StageMetrics& m = *up;
      auto& p = prev_stage_[up.get()];

      const auto c = m.count.load(std::memory_order_relaxed);
      const double fps = (dt > 0) ? (static_cast<double>(c - p.count) / dt) : 0.0;
      p.count = c;

      const auto work = m.work_ns_total.load(std::memory_order_relaxed);
      double busy = (dt > 0) ? static_cast<double>(work - p.work_ns) / (dt * 1e9) : 0.0;
      busy = std::max(0.0, std::min(1.0, busy));
      auto busy_color = (busy > 0.85) ? kRed : (busy > 0.60) ? kYellow : kGreen;
      p.work_ns = work;

      const double lat_ms = NsToMs(m.avg_latency_ns.load(std::memory_order_relaxed));
      const auto le = m.last_event_ns.load(std::memory_order_relaxed);
      const double last_ms = (le == 0) ? 0.0 : NsToMs(now_ns - le);

      // Per frame averages of each loader phase
      const double per = (c == 0) ? 0.0 : 1.0 / static_cast<double>(c);
      const double io_ms = NsToMs(m.io_ns_total.load(std::memory_order_relaxed)) * per;
      const double dec_ms = NsToMs(m.decode_ns_total.load(std::memory_order_relaxed)) * per;
      const double rsz_ms = NsToMs(m.resize_ns_total.load(std::memory_order_relaxed)) * per;

      std::cout << std::left
                << std::setw(12) << m.name
                << std::setw(9) << std::fixed << std::setprecision(1) << fps
                << busy_color << std::setw(9) << std::fixed << std::setprecision(1) << (busy * 100.0) << kReset
                << std::setw(10) << std::fixed << std::setprecision(2) << lat_ms
                << std::setw(10) << std::fixed << std::setprecision(1) << last_ms
                << std::setw(10) << std::fixed << std::setprecision(2) << io_ms
                << std::setw(10) << std::fixed << std::setprecision(2) << dec_ms
                << std::setw(10) << std::fixed << std::setprecision(2) << rsz_ms
                << std::setw(8) << m.underruns.load(std::memory_order_relaxed)
                << std::setw(10) << std::fixed << std::setprecision(1) << NsToMs(m.avg_queue_wait_ns.load(std::memory_order_relaxed))
                << "\n";
    }

    std::cout << "\nLANE QUEUES\n";
    for (const auto& q : queues_) {
      const auto used = q.size_fn ? q.size_fn() : 0;
      const auto cap  = q.cap_fn ? q.cap_fn() : 0;

      double frac = (cap == 0) ? 0.0 : static_cast<double>(used) / static_cast<double>(cap);
      const char* color = (frac > 0.85) ? kGreen : (frac > 0.30) ? kYellow : kRed;

      std::cout << "  " << std::setw(11) << std::left << q.name
                << " " << color << std::setw(4) << std::right << used << "/" << std::setw(4) << std::left << cap
                << " [" << Bar(used, cap, 24) << "]" << kReset
                << "  peak=" << (q.high_water_fn ? q.high_water_fn() : 0)
                << "\n";
    }

    std::cout << "\n" << std::flush;
  }
}

} // namespace fsp
