#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <vector>

// Utilities
#include "core/config_loader.hpp"
#include "core/image_loader.hpp"
#include "core/partition.hpp"

#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

// Display
#include "display/render_sink.hpp"

// Pipeline
#include "pipeline/frame_pipeline.hpp"
#include "stages/audio_stage.hpp"
#include "stages/playback_scheduler.hpp"

#include "apps/ansi_dashboard.hpp"

static fsp::StopSource g_stop;

static void HandleSigint(int) {
  g_stop.request_stop();
}

// fsplay: streams a numbered image sequence to the display at a fixed frame rate, with its soundtrack

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/default.yaml";

  try {
    fsp::AppConfig cfg = fsp::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";
    std::cout << "Using " << cfg.source.directory << " as frame directory!" << std::endl;

    std::signal(SIGINT, HandleSigint);
    std::signal(SIGTERM, HandleSigint);

    // The display decides the resolution every loader scales to
    std::unique_ptr<fsp::RenderSink> sink = fsp::MakeRenderSink(cfg.display);
    sink->clear(cv::Scalar::all(0));
    sink->present();

    fsp::Metrics metrics;
    auto images = std::make_shared<fsp::OpenCvImageLoader>();
    fsp::FramePipeline pipeline(cfg, sink->size(), images, metrics);
    fsp::StageMetrics* playback_metrics = metrics.make_stage("playback");

    fsp::PlaybackScheduler scheduler(pipeline.queues(), *sink, cfg.playback.total_frames,
                                     fsp::FrameIntervalMs(cfg.playback), playback_metrics);

    pipeline.start(g_stop.token());

    // Runner declared after the dashboard so it joins before the dashboard goes away
    std::unique_ptr<fsp::AnsiDashboard> dashboard;
    fsp::ThreadRunner dashboard_runner("dashboard");
    if (cfg.metrics.dashboard) {
      std::vector<fsp::QueueView> views;
      for (std::size_t i = 0; i < pipeline.lane_count(); ++i) {
        auto q = pipeline.queues()[i];
        views.push_back({"lane " + std::to_string(i),
                         [q] { return q->size(); },
                         [q] { return q->capacity(); },
                         [q] { return static_cast<std::uint64_t>(q->high_water()); }});
      }
      dashboard = std::make_unique<fsp::AnsiDashboard>(
          metrics, std::move(views),
          [playback_metrics] { return playback_metrics->count.load(std::memory_order_relaxed); },
          cfg.playback.total_frames, cfg.metrics.refresh_ms);
      dashboard_runner.start(g_stop.token(), [&dashboard](const fsp::StopToken& g, const std::atomic_bool& l) {
        dashboard->run(g, l);
      });
    }

    // Let the lanes get their first batch in before the clock starts
    g_stop.token().sleep_for(std::chrono::milliseconds(cfg.playback.init_delay_ms));

    std::unique_ptr<fsp::AudioStage> audio;
    if (cfg.audio.enabled) {
      audio = std::make_unique<fsp::AudioStage>(fsp::JoinPath(cfg.source.directory, cfg.source.audio_file), cfg.audio.device);
      audio->start(g_stop.token());
    }

    const fsp::PlaybackResult result = scheduler.run(g_stop.token());

    if (result.aborted) {
      // Nobody drains the queues anymore, lanes blocked on backpressure would never finish
      std::cerr << "Playback aborted at frame " << result.frames_presented << ", stopping loaders" << std::endl;
      pipeline.stop();
    } else {
      pipeline.join();
    }

    if (audio) {
      if (result.completed && !g_stop.stop_requested()) {
        audio->join();
      } else {
        audio->stop();
      }
    }

    dashboard_runner.request_stop();
    dashboard_runner.join();

    if (!result.completed) return 2;

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
