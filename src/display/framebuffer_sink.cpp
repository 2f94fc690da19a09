#include "display/framebuffer_sink.hpp"

#include <fcntl.h>
#include <linux/fb.h>
#include <linux/kd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace fsp {

static std::runtime_error FbError(const std::string& device, const std::string& what) {
  return std::runtime_error("Framebuffer " + device + ": " + what + ": " + std::strerror(errno));
}

FramebufferSink::FramebufferSink(const std::string& device, const std::string& tty, bool graphics_mode) {
  fb_fd_ = ::open(device.c_str(), O_RDWR);
  if (fb_fd_ < 0) throw FbError(device, "open failed");

  fb_var_screeninfo var{};
  fb_fix_screeninfo fix{};
  if (::ioctl(fb_fd_, FBIOGET_VSCREENINFO, &var) < 0 || ::ioctl(fb_fd_, FBIOGET_FSCREENINFO, &fix) < 0) {
    const auto err = FbError(device, "screen info query failed");
    ::close(fb_fd_);
    throw err;
  }

  bpp_ = static_cast<int>(var.bits_per_pixel);
  line_length_ = fix.line_length;
  x_offset_bytes_ = static_cast<std::size_t>(var.xoffset) * (bpp_ / 8);
  y_offset_ = var.yoffset;

  // Channel order comes from where the device puts red
  const bool red_high = var.red.offset > var.blue.offset;
  switch (bpp_) {
    case 16: color_code_ = red_high ? cv::COLOR_BGR2BGR565 : cv::COLOR_RGB2BGR565; break;
    case 24: color_code_ = red_high ? -1 : cv::COLOR_BGR2RGB; break;
    case 32: color_code_ = red_high ? cv::COLOR_BGR2BGRA : cv::COLOR_BGR2RGBA; break;
    default:
      ::close(fb_fd_);
      throw std::runtime_error("Framebuffer " + device + ": unsupported depth " + std::to_string(bpp_) + " bpp");
  }

  fb_len_ = fix.smem_len;
  void* mem = ::mmap(nullptr, fb_len_, PROT_READ | PROT_WRITE, MAP_SHARED, fb_fd_, 0);
  if (mem == MAP_FAILED) {
    const auto err = FbError(device, "mmap failed");
    ::close(fb_fd_);
    throw err;
  }
  fb_mem_ = static_cast<std::uint8_t*>(mem);

  back_ = cv::Mat(static_cast<int>(var.yres), static_cast<int>(var.xres), CV_8UC3, cv::Scalar::all(0));

  if (graphics_mode) set_graphics_mode(tty);

  std::cout << "Framebuffer " << device << " initialized as " << var.xres << "x" << var.yres
            << " (" << bpp_ << " bpp)" << std::endl;
}

FramebufferSink::~FramebufferSink() {
  restore_text_mode();
  if (fb_mem_) ::munmap(fb_mem_, fb_len_);
  if (fb_fd_ >= 0) ::close(fb_fd_);
}

// Hides the console cursor and text. Not fatal, playback still works underneath a text console
void FramebufferSink::set_graphics_mode(const std::string& tty) {
  tty_fd_ = ::open(tty.c_str(), O_RDWR);
  if (tty_fd_ < 0) {
    std::cerr << "Failed to open " << tty << " for graphics mode: " << std::strerror(errno) << std::endl;
    return;
  }
  if (::ioctl(tty_fd_, KDSETMODE, KD_GRAPHICS) < 0) {
    std::cerr << "Failed to set graphics mode on framebuffer: " << std::strerror(errno) << std::endl;
    ::close(tty_fd_);
    tty_fd_ = -1;
    return;
  }
  graphics_mode_set_ = true;
}

void FramebufferSink::restore_text_mode() {
  if (graphics_mode_set_ && ::ioctl(tty_fd_, KDSETMODE, KD_TEXT) < 0) {
    std::cerr << "Failed to restore text mode: " << std::strerror(errno) << std::endl;
  }
  graphics_mode_set_ = false;
  if (tty_fd_ >= 0) ::close(tty_fd_);
  tty_fd_ = -1;
}

void FramebufferSink::clear(const cv::Scalar& color) {
  back_.setTo(color);
}

void FramebufferSink::draw(int x, int y, const cv::Mat& image) {
  BlitClipped(back_, x, y, image);
}

void FramebufferSink::present() {
  const cv::Mat* src = &back_;
  if (color_code_ >= 0) {
    cv::cvtColor(back_, converted_, color_code_);
    src = &converted_;
  }

  const std::size_t row_bytes = static_cast<std::size_t>(src->cols) * src->elemSize();
  for (int r = 0; r < src->rows; ++r) {
    const std::size_t offset = (y_offset_ + static_cast<std::size_t>(r)) * line_length_ + x_offset_bytes_;
    if (offset + row_bytes > fb_len_) break;
    std::memcpy(fb_mem_ + offset, src->ptr(r), row_bytes);
  }
}

} // namespace fsp
