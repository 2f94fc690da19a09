#include "display/window_sink.hpp"

#include <utility>

#include <opencv2/highgui.hpp>

namespace fsp {

WindowSink::WindowSink(std::string window_name, cv::Size size)
    : window_name_(std::move(window_name)), back_(size, CV_8UC3, cv::Scalar::all(0)) {
  cv::namedWindow(window_name_, cv::WINDOW_AUTOSIZE);
}

WindowSink::~WindowSink() {
  cv::destroyWindow(window_name_);
}

void WindowSink::clear(const cv::Scalar& color) {
  back_.setTo(color);
}

void WindowSink::draw(int x, int y, const cv::Mat& image) {
  BlitClipped(back_, x, y, image);
}

void WindowSink::present() {
  cv::imshow(window_name_, back_);
  // highgui only repaints while pumping events
  cv::waitKey(1);
}

} // namespace fsp
