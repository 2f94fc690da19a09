#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace fsp {

// One thread per lane, each with its own preload queue
static constexpr std::size_t kMaxLoaderThreads = 256;

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

// Undefined (not Null) when absent, so callers can fall back with !node
static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
  return parent[key];
}

// A top level section: absent or empty is fine, anything but a map is an error
static YAML::Node Section(const YAML::Node& root, const char* name) {
  const YAML::Node n = Child(root, name);
  if (!n || n.IsNull()) return YAML::Node(YAML::NodeType::Undefined);
  if (!n.IsMap()) throw ConfigError(name, "must be a map");
  return n;
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n || n.IsNull()) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static LaneFaultPolicy ParseLaneFaultPolicyKey(const YAML::Node& parent, const char* key, const std::string& key_path, LaneFaultPolicy fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n || n.IsNull()) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "stall") return LaneFaultPolicy::Stall;
  if (s == "abort") return LaneFaultPolicy::Abort;
  throw ConfigError(key_path, "unknown lane_fault_policy '" + s + "'. Use: stall | abort");
}

static ResizeFilter ParseResizeFilterKey(const YAML::Node& parent, const char* key, const std::string& key_path, ResizeFilter fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n || n.IsNull()) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "nearest") return ResizeFilter::Nearest;
  if (s == "linear" || s == "triangle") return ResizeFilter::Linear;
  if (s == "cubic") return ResizeFilter::Cubic;
  if (s == "area") return ResizeFilter::Area;
  if (s == "lanczos") return ResizeFilter::Lanczos;
  throw ConfigError(key_path, "unknown resize_filter '" + s + "'. Use: nearest | linear | cubic | area | lanczos");
}

static void LoadSource(const YAML::Node& root, SourceConfig& cfg) {
  const YAML::Node src = Section(root, "source");
  if (!src) return;
  const std::string p = "source";

  cfg.directory = GetOrKey<std::string>(src, "directory", PathJoin(p, "directory"), cfg.directory);
  cfg.frame_format = GetOrKey<std::string>(src, "frame_format", PathJoin(p, "frame_format"), cfg.frame_format);
  cfg.index_width = GetOrKey<int>(src, "index_width", PathJoin(p, "index_width"), cfg.index_width);
  cfg.audio_file = GetOrKey<std::string>(src, "audio_file", PathJoin(p, "audio_file"), cfg.audio_file);
}

static void LoadPlayback(const YAML::Node& root, PlaybackConfig& cfg) {
  const YAML::Node pb = Section(root, "playback");
  if (!pb) return;
  const std::string p = "playback";

  cfg.total_frames = GetOrKey<std::size_t>(pb, "total_frames", PathJoin(p, "total_frames"), cfg.total_frames);
  cfg.framerate = GetOrKey<int>(pb, "framerate", PathJoin(p, "framerate"), cfg.framerate);
  cfg.init_delay_ms = GetOrKey<int>(pb, "init_delay_ms", PathJoin(p, "init_delay_ms"), cfg.init_delay_ms);
  cfg.lane_fault_policy = ParseLaneFaultPolicyKey(pb, "lane_fault_policy", PathJoin(p, "lane_fault_policy"), cfg.lane_fault_policy);
}

static void LoadLoader(const YAML::Node& root, LoaderConfig& cfg) {
  const YAML::Node ld = Section(root, "loader");
  if (!ld) return;
  const std::string p = "loader";

  cfg.threads = GetOrKey<std::size_t>(ld, "threads", PathJoin(p, "threads"), cfg.threads);
  cfg.preload_frames = GetOrKey<std::size_t>(ld, "preload_frames", PathJoin(p, "preload_frames"), cfg.preload_frames);
  cfg.backpressure_wait_ms = GetOrKey<int>(ld, "backpressure_wait_ms", PathJoin(p, "backpressure_wait_ms"), cfg.backpressure_wait_ms);
  cfg.resize_filter = ParseResizeFilterKey(ld, "resize_filter", PathJoin(p, "resize_filter"), cfg.resize_filter);
}

static void LoadDisplay(const YAML::Node& root, DisplayConfig& cfg) {
  const YAML::Node disp = Section(root, "display");
  if (!disp) return;
  const std::string p = "display";

  cfg.backend = GetOrKey<std::string>(disp, "backend", PathJoin(p, "backend"), cfg.backend);
  cfg.device = GetOrKey<std::string>(disp, "device", PathJoin(p, "device"), cfg.device);
  cfg.tty = GetOrKey<std::string>(disp, "tty", PathJoin(p, "tty"), cfg.tty);
  cfg.graphics_mode = GetOrKey<bool>(disp, "graphics_mode", PathJoin(p, "graphics_mode"), cfg.graphics_mode);
  cfg.width = GetOrKey<int>(disp, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(disp, "height", PathJoin(p, "height"), cfg.height);
  cfg.window_name = GetOrKey<std::string>(disp, "window_name", PathJoin(p, "window_name"), cfg.window_name);
}

static void LoadAudio(const YAML::Node& root, AudioConfig& cfg) {
  const YAML::Node au = Section(root, "audio");
  if (!au) return;
  const std::string p = "audio";

  cfg.enabled = GetOrKey<bool>(au, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.device = GetOrKey<std::string>(au, "device", PathJoin(p, "device"), cfg.device);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const YAML::Node m = Section(root, "metrics");
  if (!m) return;
  const std::string p = "metrics";

  cfg.dashboard = GetOrKey<bool>(m, "dashboard", PathJoin(p, "dashboard"), cfg.dashboard);
  cfg.refresh_ms = GetOrKey<int>(m, "refresh_ms", PathJoin(p, "refresh_ms"), cfg.refresh_ms);
}

std::size_t EffectiveLaneCount(const LoaderConfig& cfg) {
  if (cfg.threads > 0) return cfg.threads;
  const unsigned hw = std::thread::hardware_concurrency();
  return std::max<std::size_t>(1, hw);
}

std::size_t EffectivePreloadDepth(const AppConfig& cfg) {
  if (cfg.loader.preload_frames > 0) return cfg.loader.preload_frames;
  return static_cast<std::size_t>(cfg.playback.framerate);
}

std::uint64_t FrameIntervalMs(const PlaybackConfig& cfg) {
  return static_cast<std::uint64_t>(1000 / cfg.framerate);
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.source.directory.empty()) throw ConfigError("source.directory", "must not be empty");
  if (cfg.source.frame_format.empty()) throw ConfigError("source.frame_format", "must not be empty");
  if (cfg.source.index_width < 1) throw ConfigError("source.index_width", "must be >= 1");

  if (cfg.playback.total_frames < 1) throw ConfigError("playback.total_frames", "must be >= 1");
  if (cfg.playback.framerate <= 0 || cfg.playback.framerate > 1000)
    throw ConfigError("playback.framerate", "must be in [1, 1000]");
  if (cfg.playback.init_delay_ms < 0) throw ConfigError("playback.init_delay_ms", "must be >= 0");

  if (cfg.loader.threads > kMaxLoaderThreads)
    throw ConfigError("loader.threads", "must be <= " + std::to_string(kMaxLoaderThreads) + " (0 = hardware threads)");
  if (cfg.loader.backpressure_wait_ms <= 0) throw ConfigError("loader.backpressure_wait_ms", "must be > 0");

  const std::string& b = cfg.display.backend;
  if (b != "fbdev" && b != "window" && b != "headless")
    throw ConfigError("display.backend", "unknown backend '" + b + "'. Use: fbdev | window | headless");
  if (b == "fbdev" && cfg.display.device.empty())
    throw ConfigError("display.device", "required when display.backend = 'fbdev'");
  if (b != "fbdev" && (cfg.display.width <= 0 || cfg.display.height <= 0))
    throw ConfigError("display", "width/height must be > 0");

  if (cfg.audio.enabled && cfg.audio.device.empty())
    throw ConfigError("audio.device", "required when audio.enabled = true");

  if (cfg.metrics.refresh_ms <= 0) throw ConfigError("metrics.refresh_ms", "must be > 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  // An empty document means all defaults
  if (root && !root.IsNull() && !root.IsMap()) throw ConfigError("<root>", "must be a map of sections");

  LoadSource(root, cfg.source);
  LoadPlayback(root, cfg.playback);
  LoadLoader(root, cfg.loader);
  LoadDisplay(root, cfg.display);
  LoadAudio(root, cfg.audio);
  LoadMetrics(root, cfg.metrics);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& text) {
  YAML::Node root;

  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace fsp
