#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "display/render_sink.hpp"

namespace fsp {

// Linux fbdev output. The back buffer is kept in BGR and converted to the
// device's pixel layout (16/24/32 bpp) on present()
class FramebufferSink final : public RenderSink {
public:
  // Throws std::runtime_error if the device can't be opened or mapped
  FramebufferSink(const std::string& device, const std::string& tty, bool graphics_mode);
  ~FramebufferSink() override;

  FramebufferSink(const FramebufferSink&) = delete;
  FramebufferSink& operator=(const FramebufferSink&) = delete;

  cv::Size size() const override { return back_.size(); }

  void clear(const cv::Scalar& color) override;
  void draw(int x, int y, const cv::Mat& image) override;
  void present() override;

  int bits_per_pixel() const { return bpp_; }

private:
  void set_graphics_mode(const std::string& tty);
  void restore_text_mode();

  int fb_fd_{-1};
  int tty_fd_{-1};
  bool graphics_mode_set_{false};

  std::uint8_t* fb_mem_{nullptr};
  std::size_t fb_len_{0};
  std::size_t line_length_{0};
  std::size_t x_offset_bytes_{0};
  std::size_t y_offset_{0};
  int bpp_{0};
  int color_code_{-1}; // cv::cvtColor code from BGR to device layout, -1 when none

  cv::Mat back_;      // BGR composition target
  cv::Mat converted_; // device layout, reused between presents
};

} // namespace fsp
