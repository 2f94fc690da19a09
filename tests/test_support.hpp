#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "core/image_loader.hpp"
#include "display/render_sink.hpp"

/*
    Shared pieces for the test executables. Each test binary returns the number of
    failed checks, so CTest reports a failure if any CHECK did not hold.
*/

namespace fsp::test {

inline int& Failures() {
  static int failures = 0;
  return failures;
}

#define CHECK(cond)                                                                  \
  do {                                                                               \
    if (!(cond)) {                                                                   \
      ++::fsp::test::Failures();                                                     \
      std::cerr << __FILE__ << ":" << __LINE__ << ": CHECK failed: " #cond << "\n"; \
    }                                                                                \
  } while (0)

#define CHECK_EQ(a, b)                                                                       \
  do {                                                                                       \
    const auto va_ = (a);                                                                    \
    const auto vb_ = (b);                                                                    \
    if (!(va_ == vb_)) {                                                                     \
      ++::fsp::test::Failures();                                                             \
      std::cerr << __FILE__ << ":" << __LINE__ << ": CHECK_EQ failed: " #a " == " #b " ("    \
                << va_ << " vs " << vb_ << ")\n";                                            \
    }                                                                                        \
  } while (0)

inline int Summary(const char* name) {
  if (Failures() == 0) {
    std::cout << "[" << name << "] all checks passed\n";
  } else {
    std::cout << "[" << name << "] " << Failures() << " check(s) failed\n";
  }
  return Failures() == 0 ? 0 : 1;
}

// Polls 'pred' until it holds or 'timeout' passes
template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
  explicit TempDir(const std::string& tag) {
    namespace fs = std::filesystem;
    path_ = fs::temp_directory_path() / (tag + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  std::string str() const { return path_.string(); }

private:
  std::filesystem::path path_;
};

// Frame index and lane are written into the first pixel so sinks can tell frames apart
inline cv::Scalar TagColor(std::uint64_t index, std::size_t lane) {
  return cv::Scalar(static_cast<double>(index % 256), static_cast<double>(lane % 256), static_cast<double>((index / 256) % 256));
}

inline std::uint64_t TaggedIndex(const cv::Mat& img) {
  const cv::Vec3b px = img.at<cv::Vec3b>(0, 0);
  return static_cast<std::uint64_t>(px[0]) + 256u * static_cast<std::uint64_t>(px[2]);
}

inline std::size_t TaggedLane(const cv::Mat& img) {
  return img.at<cv::Vec3b>(0, 0)[1];
}

// Image service that never touches the disk. The frame index is taken from the file name and
// painted into a 4x3 image. Indices can be made to fail with IO or decode errors
class FakeImageLoader final : public ImageLoader {
public:
  explicit FakeImageLoader(std::size_t lane_count = 1) : lane_count_(lane_count) {}

  std::set<std::uint64_t> missing;      // read() throws FrameIoError
  std::set<std::uint64_t> corrupt;      // decode() throws FrameDecodeError
  std::chrono::milliseconds delay{0};   // per read
  bool resize_throws = false;           // resize_exact() throws a plain std::runtime_error

  std::vector<unsigned char> read(const std::string& path) override {
    const std::uint64_t index = IndexFromPath(path);
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    reads_.fetch_add(1);
    if (missing.count(index)) throw FrameIoError("no such file " + path, path, index);
    return {static_cast<unsigned char>(index % 256), static_cast<unsigned char>((index / 256) % 256)};
  }

  cv::Mat decode(const std::vector<unsigned char>& bytes, const std::string& path) override {
    const std::uint64_t index = IndexFromPath(path);
    if (corrupt.count(index) || bytes.size() != 2) throw FrameDecodeError("corrupt image " + path, path, index);
    return cv::Mat(3, 4, CV_8UC3, TagColor(index, index % lane_count_));
  }

  cv::Mat resize_exact(const cv::Mat& img, cv::Size size, ResizeFilter) override {
    if (resize_throws) throw std::runtime_error("resize blew up");
    cv::Mat out;
    cv::resize(img, out, size, 0, 0, cv::INTER_NEAREST);
    return out;
  }

  int reads() const { return reads_.load(); }

  static std::uint64_t IndexFromPath(const std::string& path) {
    return std::stoull(std::filesystem::path(path).stem().string()) - 1;
  }

private:
  std::size_t lane_count_;
  std::atomic<int> reads_{0};
};

// Remembers which frame and lane every present() showed
class RecordingSink final : public RenderSink {
public:
  explicit RecordingSink(cv::Size size) : canvas_(size, CV_8UC3, cv::Scalar::all(0)) {}

  cv::Size size() const override { return canvas_.size(); }
  void clear(const cv::Scalar& color) override { canvas_.setTo(color); }
  void draw(int x, int y, const cv::Mat& image) override {
    BlitClipped(canvas_, x, y, image);
    last_draw_size = image.size();
  }
  void present() override {
    std::lock_guard<std::mutex> lock(mu_);
    indices_.push_back(TaggedIndex(canvas_));
    lanes_.push_back(TaggedLane(canvas_));
  }

  std::vector<std::uint64_t> indices() const {
    std::lock_guard<std::mutex> lock(mu_);
    return indices_;
  }
  std::vector<std::size_t> lanes() const {
    std::lock_guard<std::mutex> lock(mu_);
    return lanes_;
  }

  cv::Size last_draw_size;

private:
  mutable std::mutex mu_;
  cv::Mat canvas_;
  std::vector<std::uint64_t> indices_;
  std::vector<std::size_t> lanes_;
};

} // namespace fsp::test
