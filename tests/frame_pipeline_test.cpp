#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "infra/metrics.hpp"
#include "pipeline/frame_pipeline.hpp"
#include "stages/playback_scheduler.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static fsp::AppConfig SmallConfig(std::size_t lanes, std::uint64_t total, std::size_t preload) {
  fsp::AppConfig cfg;
  cfg.source.directory = "/frames";
  cfg.source.frame_format = "png";
  cfg.playback.total_frames = total;
  cfg.loader.threads = lanes;
  cfg.loader.preload_frames = preload;
  cfg.loader.backpressure_wait_ms = 5;
  return cfg;
}

// Drives the scheduler with synthetic time, one interval per call, until 'done' holds
template <typename Done>
static bool TickUntil(fsp::PlaybackScheduler& scheduler, std::uint64_t& now, Done done) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    now += 100;
    if (done(scheduler.tick(now))) return true;
    std::this_thread::sleep_for(1ms);
  }
  return false;
}

// Three lanes feeding one scheduler: every frame shows once, in order, each from its owning lane
static void PlaysEverythingInOrder() {
  constexpr std::uint64_t kTotal = 30;
  const fsp::AppConfig cfg = SmallConfig(3, kTotal, 4);

  auto images = std::make_shared<fsp::test::FakeImageLoader>(3);
  images->delay = 1ms;
  fsp::Metrics metrics;
  fsp::FramePipeline pipeline(cfg, cv::Size(8, 6), images, metrics);
  CHECK_EQ(pipeline.lane_count(), 3u);
  CHECK_EQ(pipeline.preload_depth(), 4u);

  fsp::test::RecordingSink sink(cv::Size(8, 6));
  fsp::PlaybackScheduler scheduler(pipeline.queues(), sink, kTotal, 1, metrics.make_stage("playback"));

  fsp::StopSource stop;
  pipeline.start(stop.token());
  const fsp::PlaybackResult result = scheduler.run(stop.token());
  pipeline.join();

  CHECK(result.completed);
  CHECK(!result.aborted);
  CHECK_EQ(result.frames_presented, kTotal);

  const auto indices = sink.indices();
  const auto lanes = sink.lanes();
  CHECK_EQ(indices.size(), kTotal);
  for (std::size_t i = 0; i < indices.size() && i < lanes.size(); ++i) {
    CHECK_EQ(indices[i], i);
    CHECK_EQ(lanes[i], i % 3);
  }
  CHECK(sink.last_draw_size == cv::Size(8, 6));

  for (std::size_t id = 0; id < pipeline.lane_count(); ++id) {
    CHECK(pipeline.lane(id).state() == fsp::LaneState::Finished);
    CHECK(pipeline.queues()[id]->high_water() <= pipeline.preload_depth());
  }
  CHECK_EQ(images->reads(), static_cast<int>(kTotal));
}

// Frame 4 is corrupt. With the stall policy lane 0 dies quietly, playback freezes at 4
// and keeps underrunning while lane 1 carries on up to its preload depth
static void FailedLaneStallsPlayback() {
  const fsp::AppConfig cfg = SmallConfig(2, 10, 2);

  auto images = std::make_shared<fsp::test::FakeImageLoader>(2);
  images->corrupt = {4};
  fsp::Metrics metrics;
  fsp::FramePipeline pipeline(cfg, cv::Size(8, 6), images, metrics);

  fsp::test::RecordingSink sink(cv::Size(8, 6));
  fsp::PlaybackScheduler scheduler(pipeline.queues(), sink, 10, 16);

  fsp::StopSource stop;
  pipeline.start(stop.token());

  std::uint64_t now = 1000;
  CHECK(TickUntil(scheduler, now, [&](fsp::TickOutcome) { return scheduler.cursor() == 4; }));
  CHECK(fsp::test::WaitFor([&] { return pipeline.lane(0).state() == fsp::LaneState::Failed; }));

  const std::uint64_t underruns_before = scheduler.underruns();
  for (int i = 0; i < 5; ++i) {
    now += 100;
    CHECK(scheduler.tick(now) == fsp::TickOutcome::kUnderrun);
  }
  CHECK_EQ(scheduler.cursor(), 4u);
  CHECK_EQ(scheduler.underruns(), underruns_before + 5);
  CHECK(!pipeline.queues()[0]->closed());

  // Lane 1 is unaffected: 1 and 3 were shown, 5 and 7 sit in its queue
  CHECK(fsp::test::WaitFor([&] { return pipeline.queues()[1]->pushes_total() >= 4u; }));
  CHECK(pipeline.lane(1).state() == fsp::LaneState::Loading);

  pipeline.stop();
  CHECK(pipeline.lane(0).state() == fsp::LaneState::Failed);
  CHECK(pipeline.lane(1).state() == fsp::LaneState::Stopped);
  CHECK(sink.indices() == (std::vector<std::uint64_t>{0, 1, 2, 3}));
}

// Same fault under the abort policy: the scheduler sees lane 0 disconnect at frame 4
static void FailedLaneAbortsPlayback() {
  fsp::AppConfig cfg = SmallConfig(2, 10, 2);
  cfg.playback.lane_fault_policy = fsp::LaneFaultPolicy::Abort;

  auto images = std::make_shared<fsp::test::FakeImageLoader>(2);
  images->corrupt = {4};
  fsp::Metrics metrics;
  fsp::FramePipeline pipeline(cfg, cv::Size(8, 6), images, metrics);

  fsp::test::RecordingSink sink(cv::Size(8, 6));
  fsp::PlaybackScheduler scheduler(pipeline.queues(), sink, 10, 16);

  fsp::StopSource stop;
  pipeline.start(stop.token());

  std::uint64_t now = 1000;
  CHECK(TickUntil(scheduler, now, [](fsp::TickOutcome o) { return o == fsp::TickOutcome::kDisconnected; }));
  CHECK_EQ(scheduler.cursor(), 4u);
  CHECK(pipeline.queues()[0]->closed());

  pipeline.stop();
  CHECK(pipeline.lane(0).state() == fsp::LaneState::Failed);
  CHECK(sink.indices() == (std::vector<std::uint64_t>{0, 1, 2, 3}));
}

// A global stop while lanes sit on backpressure ends them all without a consumer
static void GlobalStopEndsAllLanes() {
  const fsp::AppConfig cfg = SmallConfig(4, 1000, 3);

  auto images = std::make_shared<fsp::test::FakeImageLoader>(4);
  fsp::Metrics metrics;
  fsp::FramePipeline pipeline(cfg, cv::Size(8, 6), images, metrics);

  fsp::StopSource stop;
  pipeline.start(stop.token());
  CHECK(fsp::test::WaitFor([&] {
    for (const auto& q : pipeline.queues())
      if (q->size() < 3) return false;
    return true;
  }));

  stop.request_stop();
  pipeline.join();

  for (std::size_t id = 0; id < pipeline.lane_count(); ++id) {
    CHECK(pipeline.lane(id).state() == fsp::LaneState::Stopped);
    CHECK(!pipeline.lane(id).running());
  }
  CHECK_EQ(images->reads(), 12);
}

int main() {
  PlaysEverythingInOrder();
  FailedLaneStallsPlayback();
  FailedLaneAbortsPlayback();
  GlobalStopEndsAllLanes();
  return fsp::test::Summary("frame_pipeline_test");
}
