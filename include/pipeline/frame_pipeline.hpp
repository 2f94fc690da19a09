#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/image_loader.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "stages/loader_stage.hpp"

namespace fsp {

// Owns the lanes: one queue and one loader stage each. Built once from config, torn down at exit
class FramePipeline {
public:
  FramePipeline(const AppConfig& cfg, cv::Size target_size, std::shared_ptr<ImageLoader> images, Metrics& metrics);
  ~FramePipeline();

  FramePipeline(const FramePipeline&) = delete;
  FramePipeline& operator=(const FramePipeline&) = delete;

  void start(StopToken global_stop);

  // Waits for every lane to finish, fail or stop on its own
  void join();

  // Asks every lane to stop and waits for them. Used when nobody will drain the queues anymore
  void stop();

  std::size_t lane_count() const { return queues_.size(); }
  std::size_t preload_depth() const { return preload_depth_; }

  const std::vector<std::shared_ptr<FrameQueue>>& queues() const { return queues_; }
  const LoaderStage& lane(std::size_t id) const { return *loaders_.at(id); }

private:
  std::size_t preload_depth_;
  std::vector<std::shared_ptr<FrameQueue>> queues_;
  std::vector<std::unique_ptr<LoaderStage>> loaders_;
};

} // namespace fsp
