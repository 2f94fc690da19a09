#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace fsp {

// What a lane does to its queue when it cannot produce a frame
enum class LaneFaultPolicy {
  Stall, // leave the queue open, scheduler waits on the missing frame forever
  Abort  // close the queue, scheduler sees a disconnected lane and stops
};

enum class ResizeFilter {
  Nearest,
  Linear,
  Cubic,
  Area,
  Lanczos
};

struct SourceConfig {
  std::string directory = "/usr/share/bad-apple/";
  std::string frame_format = "jpg";
  int index_width = 3;
  std::string audio_file = "music.mp3";
};

struct PlaybackConfig {
  std::size_t total_frames = 6571;
  int framerate = 60;
  int init_delay_ms = 500;
  LaneFaultPolicy lane_fault_policy = LaneFaultPolicy::Stall;
};

struct LoaderConfig {
  std::size_t threads = 0;        // 0 = one lane per hardware thread
  std::size_t preload_frames = 0; // 0 = one second of video (framerate)
  int backpressure_wait_ms = 100;
  ResizeFilter resize_filter = ResizeFilter::Linear;
};

struct DisplayConfig {
  std::string backend = "fbdev"; // fbdev | window | headless
  std::string device = "/dev/fb0";
  std::string tty = "/dev/tty0";
  bool graphics_mode = true;

  // Only used by window/headless backends, fbdev reports its own size
  int width = 320;
  int height = 240;
  std::string window_name = "fsplay";
};

struct AudioConfig {
  bool enabled = true;
  std::string device = "default";
};

struct MetricsConfig {
  bool dashboard = false;
  int refresh_ms = 300;
};

struct AppConfig {
  SourceConfig source{};
  PlaybackConfig playback{};
  LoaderConfig loader{};
  DisplayConfig display{};
  AudioConfig audio{};
  MetricsConfig metrics{};
};

// Lane count after resolving the "0 = hardware threads" default
std::size_t EffectiveLaneCount(const LoaderConfig& cfg);

// Preload depth after resolving the "0 = framerate" default
std::size_t EffectivePreloadDepth(const AppConfig& cfg);

// Milliseconds between frames, integer division like the tick comparison expects
std::uint64_t FrameIntervalMs(const PlaybackConfig& cfg);

}
