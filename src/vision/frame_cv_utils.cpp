#include "frame_cv_utils.hpp"
#include <scanbox/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <vector>

namespace scanbox::vision::detail {

namespace sc = scanbox::core;

std::optional<cv::Mat> frame_to_mat(const sc::Frame& frame) {
  if (!frame.valid()) return std::nullopt;

  int type = CV_8UC1;
  switch (frame.format()) {
    case sc::PixelFormat::Grayscale8:
      type = CV_8UC1;
      break;
    case sc::PixelFormat::RGB8:
    case sc::PixelFormat::BGR8:
      type = CV_8UC3;
      break;
    case sc::PixelFormat::RGBA8:
    case sc::PixelFormat::BGRA8:
      type = CV_8UC4;
      break;
    default:
      return std::nullopt;
  }
  // cv::Mat has no const view; the returned header is only ever read from.
  auto* data = const_cast<std::byte*>(frame.data().data());
  return cv::Mat(static_cast<int>(frame.height()), static_cast<int>(frame.width()), type, data,
                 frame.stride());
}

std::optional<sc::PixelFormat> format_for(const cv::Mat& mat) {
  if (mat.depth() != CV_8U) return std::nullopt;
  switch (mat.channels()) {
    case 1:
      return sc::PixelFormat::Grayscale8;
    case 3:
      return sc::PixelFormat::BGR8;
    case 4:
      return sc::PixelFormat::BGRA8;
    default:
      return std::nullopt;
  }
}

sc::Frame mat_to_frame(const cv::Mat& mat, sc::PixelFormat format) {
  if (mat.empty() || mat.dims != 2) return sc::Frame();

  // Keep the source row step; a submatrix is one block from its first to its last row.
  const std::size_t step = mat.step[0];
  const std::size_t row_bytes = static_cast<std::size_t>(mat.cols) * mat.elemSize();
  const std::size_t len = step * static_cast<std::size_t>(mat.rows - 1) + row_bytes;
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), mat.ptr(), len);
  return sc::Frame(static_cast<std::uint32_t>(mat.cols), static_cast<std::uint32_t>(mat.rows),
                   format, step, std::move(buffer));
}

std::optional<cv::Mat> to_gray(const sc::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (frame.format()) {
    case sc::PixelFormat::Grayscale8:
      return *mat;
    case sc::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case sc::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case sc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGBA2GRAY);
      break;
    case sc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGRA2GRAY);
      break;
    default:
      return std::nullopt;
  }
  return gray;
}

cv::Rect roi_to_pixels(const sc::NormalizedRect& roi, cv::Size size) {
  const int x0 = static_cast<int>(std::floor(roi.x * static_cast<float>(size.width)));
  const int y0 = static_cast<int>(std::floor(roi.y * static_cast<float>(size.height)));
  const int x1 = static_cast<int>(std::ceil((roi.x + roi.width) * static_cast<float>(size.width)));
  const int y1 = static_cast<int>(std::ceil((roi.y + roi.height) * static_cast<float>(size.height)));
  return cv::Rect(cv::Point(x0, y0), cv::Point(x1, y1)) & cv::Rect(0, 0, size.width, size.height);
}

}  // namespace scanbox::vision::detail
