#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace fsp {

// Base for everything that stops a loader lane
class FrameLoadError : public std::runtime_error {
public:
  FrameLoadError(const std::string& what, std::string path, std::uint64_t index = 0)
      : std::runtime_error(what), path_(std::move(path)), index_(index) {}

  const std::string& path() const { return path_; }
  std::uint64_t index() const { return index_; }

private:
  std::string path_;
  std::uint64_t index_;
};

// Source file missing or unreadable
class FrameIoError final : public FrameLoadError {
public:
  using FrameLoadError::FrameLoadError;
};

// Source file readable but not a valid image
class FrameDecodeError final : public FrameLoadError {
public:
  using FrameLoadError::FrameLoadError;
};

} // namespace fsp
