#pragma once

#include <memory>

#include <opencv2/core.hpp>

#include "core/config.hpp"

/*
    RenderSink is the display the scheduler draws into. Its size is fixed for its
    whole lifetime and is known before the pipeline is built, loaders scale to it.
    Draw composites into a back buffer, Present makes it visible.
*/

namespace fsp {

class RenderSink {
public:
  virtual ~RenderSink() = default;

  virtual cv::Size size() const = 0;

  virtual void clear(const cv::Scalar& color) = 0;
  virtual void draw(int x, int y, const cv::Mat& image) = 0;
  virtual void present() = 0;
};

// Builds the sink named by display.backend. Throws std::runtime_error if it can't be opened
std::unique_ptr<RenderSink> MakeRenderSink(const DisplayConfig& cfg);

// Copies 'image' into 'canvas' at (x, y), clipped to the canvas
void BlitClipped(cv::Mat& canvas, int x, int y, const cv::Mat& image);

} // namespace fsp
