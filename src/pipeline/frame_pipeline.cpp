#include "pipeline/frame_pipeline.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace fsp {

FramePipeline::FramePipeline(const AppConfig& cfg, cv::Size target_size, std::shared_ptr<ImageLoader> images, Metrics& metrics)
    : preload_depth_(EffectivePreloadDepth(cfg)) {
  const std::size_t lanes = EffectiveLaneCount(cfg.loader);

  queues_.reserve(lanes);
  loaders_.reserve(lanes);

  for (std::size_t id = 0; id < lanes; ++id) {
    LoaderLaneConfig lc;
    lc.lane_id = id;
    lc.lane_count = lanes;
    lc.total_frames = cfg.playback.total_frames;
    lc.directory = cfg.source.directory;
    lc.frame_format = cfg.source.frame_format;
    lc.index_width = cfg.source.index_width;
    lc.target_size = target_size;
    lc.filter = cfg.loader.resize_filter;
    lc.preload_depth = preload_depth_;
    lc.backpressure_wait_ms = cfg.loader.backpressure_wait_ms;
    lc.fault_policy = cfg.playback.lane_fault_policy;

    auto q = std::make_shared<FrameQueue>(preload_depth_);
    StageMetrics* m = metrics.make_stage("loader " + std::to_string(id));
    loaders_.push_back(std::make_unique<LoaderStage>(std::move(lc), images, q, m));
    queues_.push_back(std::move(q));
  }

  std::cout << "Frame pipeline: " << lanes << " lanes, preload " << preload_depth_ << " frames each, "
            << target_size.width << "x" << target_size.height << std::endl;
}

FramePipeline::~FramePipeline() = default;

void FramePipeline::start(StopToken global_stop) {
  for (auto& l : loaders_) l->start(global_stop);
}

void FramePipeline::join() {
  for (auto& l : loaders_) l->join();
}

void FramePipeline::stop() {
  for (auto& l : loaders_) l->stop();
}

} // namespace fsp
