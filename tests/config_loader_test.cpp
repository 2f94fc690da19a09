#include <fstream>
#include <stdexcept>
#include <string>

#include "core/config_loader.hpp"
#include "test_support.hpp"

template <typename Fn>
static bool Throws(Fn fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

static void DefaultsWhenEmpty() {
  const fsp::AppConfig cfg = fsp::LoadConfigFromYamlString("{}");

  CHECK_EQ(cfg.source.directory, std::string("/usr/share/bad-apple/"));
  CHECK_EQ(cfg.source.frame_format, std::string("jpg"));
  CHECK_EQ(cfg.source.index_width, 3);
  CHECK_EQ(cfg.playback.total_frames, 6571u);
  CHECK_EQ(cfg.playback.framerate, 60);
  CHECK_EQ(cfg.playback.init_delay_ms, 500);
  CHECK(cfg.playback.lane_fault_policy == fsp::LaneFaultPolicy::Stall);
  CHECK_EQ(cfg.loader.threads, 0u);
  CHECK_EQ(cfg.loader.preload_frames, 0u);
  CHECK(cfg.loader.resize_filter == fsp::ResizeFilter::Linear);
  CHECK_EQ(cfg.display.backend, std::string("fbdev"));

  // 0 resolves to framerate / hardware threads
  CHECK_EQ(fsp::EffectivePreloadDepth(cfg), 60u);
  CHECK(fsp::EffectiveLaneCount(cfg.loader) >= 1u);
  CHECK_EQ(fsp::FrameIntervalMs(cfg.playback), 16u);
}

static void SectionsOverrideDefaults() {
  const fsp::AppConfig cfg = fsp::LoadConfigFromYamlString(R"(
source:
  directory: /tmp/frames
  frame_format: png
  index_width: 4
playback:
  total_frames: 4
  framerate: 30
  lane_fault_policy: abort
loader:
  threads: 2
  preload_frames: 8
  resize_filter: nearest
display:
  backend: headless
  width: 64
  height: 48
audio:
  enabled: false
metrics:
  dashboard: true
)");

  CHECK_EQ(cfg.source.directory, std::string("/tmp/frames"));
  CHECK_EQ(cfg.source.index_width, 4);
  CHECK_EQ(cfg.playback.total_frames, 4u);
  CHECK(cfg.playback.lane_fault_policy == fsp::LaneFaultPolicy::Abort);
  CHECK_EQ(fsp::EffectiveLaneCount(cfg.loader), 2u);
  CHECK_EQ(fsp::EffectivePreloadDepth(cfg), 8u);
  CHECK(cfg.loader.resize_filter == fsp::ResizeFilter::Nearest);
  CHECK_EQ(cfg.display.backend, std::string("headless"));
  CHECK_EQ(cfg.display.width, 64);
  CHECK(!cfg.audio.enabled);
  CHECK(cfg.metrics.dashboard);
  CHECK_EQ(fsp::FrameIntervalMs(cfg.playback), 33u);
}

static void InvalidValuesAreRejected() {
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("playback: {framerate: 0}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("playback: {total_frames: 0}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("playback: {lane_fault_policy: retry}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("playback: {framerate: fast}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("loader: {resize_filter: bogus}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("loader: {backpressure_wait_ms: 0}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("display: {backend: sdl}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("display: {backend: window, width: 0}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("source: {index_width: 0}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("playback: [unclosed"); }));

  // The message names the offending key
  try {
    fsp::LoadConfigFromYamlString("playback: {lane_fault_policy: retry}");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()).find("playback.lane_fault_policy") != std::string::npos);
  }
}

// Lane count is capped, 0 still means hardware threads
static void LoaderThreadsAreBounded() {
  CHECK_EQ(fsp::LoadConfigFromYamlString("loader: {threads: 256}").loader.threads, 256u);
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("loader: {threads: 257}"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("loader: {threads: 100000000}"); }));

  try {
    fsp::LoadConfigFromYamlString("loader: {threads: 100000000}");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()).find("loader.threads") != std::string::npos);
  }
}

// A section that is not a map is reported against the section itself; empty ones keep defaults
static void SectionsMustBeMaps() {
  bool threw = false;
  try {
    fsp::LoadConfigFromYamlString("source: nope");
  } catch (const std::runtime_error& e) {
    threw = true;
    const std::string msg = e.what();
    CHECK(msg.find("'source'") != std::string::npos);
    CHECK(msg.find("must be a map") != std::string::npos);
  }
  CHECK(threw);

  CHECK(Throws([] { fsp::LoadConfigFromYamlString("loader: [1, 2]"); }));
  CHECK(Throws([] { fsp::LoadConfigFromYamlString("just a string"); }));

  const fsp::AppConfig cfg = fsp::LoadConfigFromYamlString("source:\nplayback:\n  framerate:\n");
  CHECK_EQ(cfg.source.directory, std::string("/usr/share/bad-apple/"));
  CHECK_EQ(cfg.playback.framerate, 60);
  CHECK_EQ(fsp::LoadConfigFromYamlString("").playback.total_frames, 6571u);
}

static void LoadsFromFile() {
  fsp::test::TempDir dir("fsp_config");
  const std::string path = dir.str() + "/cfg.yaml";
  {
    std::ofstream out(path);
    out << "playback:\n  framerate: 25\n";
  }

  const fsp::AppConfig cfg = fsp::LoadConfigFromYamlFile(path);
  CHECK_EQ(cfg.playback.framerate, 25);
  CHECK_EQ(fsp::FrameIntervalMs(cfg.playback), 40u);

  CHECK(Throws([&] { fsp::LoadConfigFromYamlFile(dir.str() + "/missing.yaml"); }));
}

int main() {
  DefaultsWhenEmpty();
  SectionsOverrideDefaults();
  InvalidValuesAreRejected();
  LoaderThreadsAreBounded();
  SectionsMustBeMaps();
  LoadsFromFile();
  return fsp::test::Summary("config_loader_test");
}
