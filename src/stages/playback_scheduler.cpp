#include "stages/playback_scheduler.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "core/partition.hpp"

namespace fsp {

PlaybackScheduler::PlaybackScheduler(std::vector<std::shared_ptr<BoundedQueue<Frame>>> lanes,
                                     RenderSink& sink,
                                     std::uint64_t total_frames,
                                     std::uint64_t interval_ms,
                                     StageMetrics* metrics)
    : lanes_(std::move(lanes)), sink_(sink), total_frames_(total_frames), interval_ms_(interval_ms), metrics_(metrics) {
  if (lanes_.empty()) throw std::invalid_argument("PlaybackScheduler needs at least one lane");
}

TickOutcome PlaybackScheduler::tick(std::uint64_t now_ms) {
  if (finished()) return TickOutcome::kFinished;
  if (now_ms <= last_tick_ms_ + interval_ms_) return TickOutcome::kNotDue;

  last_tick_ms_ = now_ms;

  const std::size_t lane = LaneForFrame(cursor_, lanes_.size());
  Frame f;
  switch (lanes_[lane]->try_pop(f)) {
    case PopStatus::kOk:
      break;

    case PopStatus::kEmpty:
      ++underruns_;
      if (metrics_) metrics_->on_underrun();
      std::cout << "[playback]: Buffer underrun on frame " << cursor_ << " (lane " << lane
                << "), waiting for next tick" << std::endl;
      return TickOutcome::kUnderrun;

    case PopStatus::kDisconnected:
      std::cerr << "[playback]: Lane " << lane << " disconnected before producing frame " << cursor_ << std::endl;
      return TickOutcome::kDisconnected;
  }

  if (f.index != cursor_) {
    std::cerr << "[playback]: Lane " << lane << " delivered frame " << f.index << " while expecting " << cursor_ << std::endl;
  }

  const std::uint64_t t0 = NowNs();
  sink_.draw(0, 0, f.image);
  sink_.present();
  if (metrics_) {
    metrics_->on_item(NowNs() - t0);
    const auto waited = std::chrono::steady_clock::now() - f.ready_time;
    metrics_->on_queue_wait(static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(waited).count()));
  }

  ++cursor_;
  return finished() ? TickOutcome::kFinished : TickOutcome::kPresented;
}

PlaybackResult PlaybackScheduler::run(const StopToken& global) {
  using namespace std::chrono_literals;

  std::cout << "[playback]: Started!" << std::endl;

  PlaybackResult result;
  while (!global.stop_requested()) {
    const TickOutcome outcome = tick(NowMs());
    if (outcome == TickOutcome::kFinished) {
      result.completed = true;
      break;
    }
    if (outcome == TickOutcome::kDisconnected) {
      result.aborted = true;
      break;
    }
    if (outcome == TickOutcome::kNotDue) std::this_thread::sleep_for(1ms);
  }

  result.frames_presented = cursor_;
  result.underruns = underruns_;
  std::cout << "[playback]: Stopped! " << cursor_ << "/" << total_frames_ << " frames, "
            << underruns_ << " underruns" << std::endl;
  return result;
}

} // namespace fsp
