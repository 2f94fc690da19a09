#include "display/render_sink.hpp"

#include <stdexcept>

#include "display/framebuffer_sink.hpp"
#include "display/window_sink.hpp"

namespace fsp {

std::unique_ptr<RenderSink> MakeRenderSink(const DisplayConfig& cfg) {
  if (cfg.backend == "fbdev") {
    return std::make_unique<FramebufferSink>(cfg.device, cfg.tty, cfg.graphics_mode);
  }
  if (cfg.backend == "window") {
    return std::make_unique<WindowSink>(cfg.window_name, cv::Size(cfg.width, cfg.height));
  }
  if (cfg.backend == "headless") {
    return std::make_unique<NullSink>(cv::Size(cfg.width, cfg.height));
  }
  throw std::runtime_error("Unknown display backend '" + cfg.backend + "'");
}

void BlitClipped(cv::Mat& canvas, int x, int y, const cv::Mat& image) {
  const cv::Rect target = cv::Rect(x, y, image.cols, image.rows) & cv::Rect(0, 0, canvas.cols, canvas.rows);
  if (target.empty()) return;

  const cv::Rect source(target.x - x, target.y - y, target.width, target.height);
  image(source).copyTo(canvas(target));
}

} // namespace fsp
