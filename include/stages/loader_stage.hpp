#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "core/image_loader.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace fsp {

using FrameQueue = BoundedQueue<Frame>;

struct LoaderLaneConfig {
  std::size_t lane_id = 0;
  std::size_t lane_count = 1;
  std::uint64_t total_frames = 0;

  std::string directory;
  std::string frame_format = "jpg";
  int index_width = 3;

  cv::Size target_size;
  ResizeFilter filter = ResizeFilter::Linear;

  std::size_t preload_depth = 1;
  int backpressure_wait_ms = 100;
  LaneFaultPolicy fault_policy = LaneFaultPolicy::Stall;
};

// Where a lane ended up once its thread returned
enum class LaneState {
  Loading,
  Finished, // produced every frame it owns
  Failed,   // hit an IO/decode error and gave up
  Stopped   // global or local stop before finishing
};

// Loads, decodes and scales the frames of one lane, in ascending order, into that lane's queue
class LoaderStage final : public Stage {
public:
  LoaderStage(LoaderLaneConfig cfg, std::shared_ptr<ImageLoader> images, std::shared_ptr<FrameQueue> out, StageMetrics* metrics);
  ~LoaderStage() override;

  LaneState state() const { return state_.load(std::memory_order_acquire); }

  // Next frame index this lane still owes
  std::uint64_t load_cursor() const { return cursor_.load(std::memory_order_acquire); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  // Loads one frame, throws FrameLoadError
  Frame load_frame(std::uint64_t index, std::uint64_t& io_ns, std::uint64_t& decode_ns, std::uint64_t& resize_ns);

  void fail(std::uint64_t index, const char* phase, const FrameLoadError& e);

  LoaderLaneConfig cfg_;
  std::shared_ptr<ImageLoader> images_;
  std::shared_ptr<FrameQueue> out_;
  StageMetrics* metrics_;

  std::atomic<std::uint64_t> cursor_;
  std::atomic<LaneState> state_{LaneState::Loading};
};

} // namespace fsp
