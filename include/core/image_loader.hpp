#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/errors.hpp"

/*
    ImageLoader is the image service used by loader lanes: read a file, decode it,
    scale it to the display. Each step is separate so the lane can time them.
*/

namespace fsp {

class ImageLoader {
public:
  virtual ~ImageLoader() = default;

  // Raw file contents. Throws FrameIoError
  virtual std::vector<unsigned char> read(const std::string& path) = 0;

  // Decoded BGR image. Throws FrameDecodeError
  virtual cv::Mat decode(const std::vector<unsigned char>& bytes, const std::string& path) = 0;

  // Scaled to exactly 'size', aspect ratio is not preserved
  virtual cv::Mat resize_exact(const cv::Mat& img, cv::Size size, ResizeFilter filter) = 0;
};

class OpenCvImageLoader final : public ImageLoader {
public:
  std::vector<unsigned char> read(const std::string& path) override;
  cv::Mat decode(const std::vector<unsigned char>& bytes, const std::string& path) override;
  cv::Mat resize_exact(const cv::Mat& img, cv::Size size, ResizeFilter filter) override;
};

int ToCvInterpolation(ResizeFilter filter);

} // namespace fsp
