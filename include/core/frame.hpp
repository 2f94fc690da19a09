#pragma once

#include <chrono>
#include <cstdint>

#include <opencv2/core.hpp>

/*
    Defines a single decoded frame on its way from a loader lane to the display.
    A Frame is moved into the lane queue and moved out again by the scheduler, the
    image is never shared between the two sides.
*/

namespace fsp {

using TimePoint = std::chrono::steady_clock::time_point;

struct Frame {
  // Canonical position in the sequence, 0-based
  std::uint64_t index{0};

  // Monotonic timestamp when the loader finished resizing
  TimePoint ready_time;

  // Image data already scaled to the display resolution (BGR, CV_8UC3)
  cv::Mat image;

  Frame() = default;
  Frame(Frame&&) = default;
  Frame& operator=(Frame&&) = default;

  // No copies, a frame has exactly one owner
  Frame(const Frame&) = delete;
  Frame& operator=(const Frame&) = delete;
};

} // namespace fsp
