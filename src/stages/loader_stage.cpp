#include "stages/loader_stage.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include "core/partition.hpp"

namespace fsp {

static std::uint64_t ElapsedNs(std::uint64_t since_ns) {
  return NowNs() - since_ns;
}

LoaderStage::LoaderStage(LoaderLaneConfig cfg, std::shared_ptr<ImageLoader> images, std::shared_ptr<FrameQueue> out, StageMetrics* metrics)
    : Stage("loader " + std::to_string(cfg.lane_id)),
      cfg_(std::move(cfg)),
      images_(std::move(images)),
      out_(std::move(out)),
      metrics_(metrics),
      cursor_(FirstFrameForLane(cfg_.lane_id)) {}

// The thread calls back into this object, it has to be gone before our members are
LoaderStage::~LoaderStage() {
  stop();
}

Frame LoaderStage::load_frame(std::uint64_t index, std::uint64_t& io_ns, std::uint64_t& decode_ns, std::uint64_t& resize_ns) {
  const std::string path = FramePath(cfg_.directory, index, cfg_.frame_format, cfg_.index_width);

  std::uint64_t t = NowNs();
  const std::vector<unsigned char> bytes = images_->read(path);
  io_ns = ElapsedNs(t);

  t = NowNs();
  cv::Mat decoded = images_->decode(bytes, path);
  decode_ns = ElapsedNs(t);

  t = NowNs();
  Frame f;
  f.index = index;
  f.image = images_->resize_exact(decoded, cfg_.target_size, cfg_.filter);
  f.ready_time = std::chrono::steady_clock::now();
  resize_ns = ElapsedNs(t);

  return f;
}

void LoaderStage::fail(std::uint64_t index, const char* phase, const FrameLoadError& e) {
  std::cerr << "[" << name() << "]: Failed to " << phase << " frame " << index << " via " << e.path() << std::endl;
  std::cerr << "[" << name() << "]: Error: " << e.what() << std::endl;

  state_.store(LaneState::Failed, std::memory_order_release);

  // Stall leaves the queue open so nobody learns this lane is gone
  if (cfg_.fault_policy == LaneFaultPolicy::Abort) out_->close();
}

void LoaderStage::run(const StopToken& global, const std::atomic_bool& local) {
  const auto backoff = std::chrono::milliseconds(cfg_.backpressure_wait_ms);
  auto should_stop = [&] {
    return global.stop_requested() || local.load(std::memory_order_relaxed);
  };

  std::uint64_t cur = cursor_.load(std::memory_order_relaxed);

  while (cur < cfg_.total_frames) {
    if (should_stop()) {
      state_.store(LaneState::Stopped, std::memory_order_release);
      return;
    }

    // Queue is at preload depth, wait for the scheduler to drain some
    if (out_->size() >= cfg_.preload_depth) {
      out_->wait_for_space(backoff);
      continue;
    }

    const std::uint64_t begin_frame = cur;
    const std::uint64_t begin_ns = NowNs();
    std::uint64_t io_total = 0, decode_total = 0, resize_total = 0;

    while (cur < cfg_.total_frames && out_->size() < cfg_.preload_depth && !should_stop()) {
      std::uint64_t io_ns = 0, decode_ns = 0, resize_ns = 0;
      Frame f;
      try {
        f = load_frame(cur, io_ns, decode_ns, resize_ns);
      } catch (const FrameIoError& e) {
        fail(cur, "load", e);
        return;
      } catch (const FrameDecodeError& e) {
        fail(cur, "decode", e);
        return;
      } catch (const std::exception& e) {
        // cv::Exception from resize, bad_alloc on a huge file, ...
        fail(cur, "process", FrameLoadError(e.what(), FramePath(cfg_.directory, cur, cfg_.frame_format, cfg_.index_width), cur));
        return;
      }

      io_total += io_ns;
      decode_total += decode_ns;
      resize_total += resize_ns;
      if (metrics_) metrics_->on_phases(io_ns, decode_ns, resize_ns);

      // Only this thread pushes, so a refusal means the queue is full until the scheduler pops
      while (!out_->try_push(f)) {
        if (should_stop()) {
          state_.store(LaneState::Stopped, std::memory_order_release);
          return;
        }
        out_->wait_for_space(backoff);
      }

      cur = NextFrameForLane(cur, cfg_.lane_count);
      cursor_.store(cur, std::memory_order_release);
    }

    if (cur != begin_frame) {
      std::cout << "[" << name() << "]: Loaded frames " << begin_frame << " to " << cur
                << ", took " << ElapsedNs(begin_ns) / 1000000 << "ms"
                << ", io " << io_total / 1000 << "us"
                << ", decode " << decode_total / 1000 << "us"
                << ", resize " << resize_total / 1000 << "us" << std::endl;
    }
  }

  state_.store(LaneState::Finished, std::memory_order_release);
  out_->close();
}

} // namespace fsp
