#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "display/render_sink.hpp"

namespace fsp {

// Desktop preview through an OpenCV highgui window
class WindowSink final : public RenderSink {
public:
  WindowSink(std::string window_name, cv::Size size);
  ~WindowSink() override;

  WindowSink(const WindowSink&) = delete;
  WindowSink& operator=(const WindowSink&) = delete;

  cv::Size size() const override { return back_.size(); }

  void clear(const cv::Scalar& color) override;
  void draw(int x, int y, const cv::Mat& image) override;
  void present() override;

private:
  std::string window_name_;
  cv::Mat back_;
};

// Discards everything, keeps count. Used for headless runs and benchmarks
class NullSink final : public RenderSink {
public:
  explicit NullSink(cv::Size size) : size_(size) {}

  cv::Size size() const override { return size_; }

  void clear(const cv::Scalar&) override {}
  void draw(int, int, const cv::Mat&) override { ++draws_; }
  void present() override { ++presents_; }

  std::uint64_t draws() const { return draws_; }
  std::uint64_t presents() const { return presents_; }

private:
  cv::Size size_;
  std::uint64_t draws_{0};
  std::uint64_t presents_{0};
};

} // namespace fsp
