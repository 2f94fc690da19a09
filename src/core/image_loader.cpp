#include "core/image_loader.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace fsp {

int ToCvInterpolation(ResizeFilter filter) {
  switch (filter) {
    case ResizeFilter::Nearest: return cv::INTER_NEAREST;
    case ResizeFilter::Linear: return cv::INTER_LINEAR;
    case ResizeFilter::Cubic: return cv::INTER_CUBIC;
    case ResizeFilter::Area: return cv::INTER_AREA;
    case ResizeFilter::Lanczos: return cv::INTER_LANCZOS4;
  }
  return cv::INTER_LINEAR;
}

std::vector<unsigned char> OpenCvImageLoader::read(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw FrameIoError("failed to open " + path + ": " + std::strerror(errno), path);
  }

  std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw FrameIoError("failed to read " + path, path);
  }
  return bytes;
}

cv::Mat OpenCvImageLoader::decode(const std::vector<unsigned char>& bytes, const std::string& path) {
  if (bytes.empty()) {
    throw FrameDecodeError("empty image file " + path, path);
  }

  cv::Mat img;
  try {
    img = cv::imdecode(bytes, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    throw FrameDecodeError("failed to decode " + path + ": " + e.what(), path);
  }

  // imdecode reports unknown or corrupt payloads with an empty Mat
  if (img.empty()) {
    throw FrameDecodeError("failed to decode " + path + ": unsupported or corrupt image", path);
  }
  return img;
}

cv::Mat OpenCvImageLoader::resize_exact(const cv::Mat& img, cv::Size size, ResizeFilter filter) {
  if (img.size() == size) return img;

  cv::Mat resized;
  cv::resize(img, resized, size, 0, 0, ToCvInterpolation(filter));
  return resized;
}

} // namespace fsp
