#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "core/frame.hpp"
#include "display/render_sink.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"

/*
    PlaybackScheduler is the single consumer of all lane queues.

    Every tick (strictly more than interval_ms after the previous one) it pops frame
    'cursor' from lane LaneForFrame(cursor, lanes), draws and presents it, and moves
    the cursor on. The tick baseline is reset to the current time instead of being
    advanced by a fixed step, so after a stall playback continues from "now" and never
    shows several frames in one tick to catch up.

    An empty lane is an underrun: logged, nothing else changes, next tick tries again.
    A closed and drained lane ends playback.
*/

namespace fsp {

enum class TickOutcome {
  kNotDue,
  kPresented,
  kUnderrun,
  kDisconnected,
  kFinished
};

struct PlaybackResult {
  std::uint64_t frames_presented{0};
  std::uint64_t underruns{0};
  bool completed{false}; // cursor reached total_frames
  bool aborted{false};   // a lane disconnected before its frame was produced
};

class PlaybackScheduler {
public:
  PlaybackScheduler(std::vector<std::shared_ptr<BoundedQueue<Frame>>> lanes,
                    RenderSink& sink,
                    std::uint64_t total_frames,
                    std::uint64_t interval_ms,
                    StageMetrics* metrics = nullptr);

  // One iteration at time 'now_ms'
  TickOutcome tick(std::uint64_t now_ms);

  // Ticks on the steady clock until done, aborted or a global stop
  PlaybackResult run(const StopToken& global_stop);

  std::uint64_t cursor() const { return cursor_; }
  std::uint64_t underruns() const { return underruns_; }
  bool finished() const { return cursor_ >= total_frames_; }

private:
  std::vector<std::shared_ptr<BoundedQueue<Frame>>> lanes_;
  RenderSink& sink_;
  const std::uint64_t total_frames_;
  const std::uint64_t interval_ms_;
  StageMetrics* metrics_;

  std::uint64_t cursor_{0};
  std::uint64_t last_tick_ms_{0};
  std::uint64_t underruns_{0};
};

} // namespace fsp
