#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/*
    Static strided partitioning of frame indices over loader lanes.

    Lane w owns { i : i % lane_count == w }. The loader walks its subset with
    FirstFrameForLane/NextFrameForLane and the scheduler picks the lane for the
    next frame with LaneForFrame, so both sides always agree as long as they are
    given the same lane_count.
*/

namespace fsp {

inline std::size_t LaneForFrame(std::uint64_t index, std::size_t lane_count) {
  return static_cast<std::size_t>(index % lane_count);
}

inline std::uint64_t FirstFrameForLane(std::size_t lane) {
  return static_cast<std::uint64_t>(lane);
}

inline std::uint64_t NextFrameForLane(std::uint64_t index, std::size_t lane_count) {
  return index + lane_count;
}

// Number of frames lane 'lane' owns out of 'total_frames'
inline std::uint64_t FramesOwnedByLane(std::size_t lane, std::size_t lane_count, std::uint64_t total_frames) {
  if (lane >= total_frames) return 0;
  return (total_frames - lane + lane_count - 1) / lane_count;
}

// 'directory' + '/' + 'name' without doubling the separator
std::string JoinPath(const std::string& directory, const std::string& name);

// Source file for a frame: {directory}/{index + 1, zero padded}.{extension}
std::string FramePath(const std::string& directory, std::uint64_t index, const std::string& extension, int index_width = 3);

} // namespace fsp
