#include <scanbox/vision/qr_detector.hpp>
#include "frame_cv_utils.hpp"
#include <scanbox/core/detection.hpp>
#include <scanbox/core/error.hpp>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/objdetect.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace scanbox::vision {

namespace sc = scanbox::core;

struct QrDetector::Impl {
  cv::QRCodeDetector detector;
};

QrDetector::QrDetector() : impl_(std::make_unique<Impl>()) {}

QrDetector::~QrDetector() = default;

std::expected<void, sc::ScanError> QrDetector::validate_input(const sc::Frame& input) const {
  if (!input.valid()) {
    return std::unexpected(sc::ScanError::InvalidFrame);
  }
  return {};
}

std::expected<std::vector<sc::DetectionEvent>, sc::ScanError> QrDetector::detect(
    const sc::Frame& input,
    std::optional<sc::NormalizedRect> roi) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  auto gray = detail::to_gray(input);
  if (!gray) {
    return std::unexpected(sc::ScanError::InvalidFrame);
  }

  const cv::Size size = gray->size();
  const cv::Rect region =
      roi ? detail::roi_to_pixels(*roi, size) : cv::Rect(0, 0, size.width, size.height);
  std::vector<sc::DetectionEvent> out;
  if (region.empty()) return out;

  const cv::Mat view = (*gray)(region);
  std::vector<std::string> decoded;
  cv::Mat points;
  try {
    if (!impl_->detector.detectAndDecodeMulti(view, decoded, points)) {
      // Multi-code search can miss a lone symbol; retry the single-code path.
      decoded.clear();
      points.release();
      std::string text = impl_->detector.detectAndDecode(view, points);
      if (points.empty()) return out;
      decoded.push_back(std::move(text));
    }
  } catch (const cv::Exception& e) {
    CV_LOG_WARNING(NULL, "scanbox: QR detection failed: " << e.what());
    return std::unexpected(sc::ScanError::DetectorFailed);
  }

  cv::Mat corners;
  points.convertTo(corners, CV_32F);
  const int num_points = static_cast<int>(corners.total()) * corners.channels() / 2;
  if (num_points == 0) return out;
  corners = corners.reshape(2, num_points);

  const std::size_t count = std::min(decoded.size(), static_cast<std::size_t>(num_points / 4));
  const float fw = static_cast<float>(size.width);
  const float fh = static_cast<float>(size.height);
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    sc::DetectionEvent event;
    event.type_tag = std::string(sc::kQrTypeTag);
    if (!decoded[i].empty()) event.content = decoded[i];

    float x0 = 1.f;
    float y0 = 1.f;
    float x1 = 0.f;
    float y1 = 0.f;
    for (int k = 0; k < 4; ++k) {
      const auto& p = corners.at<cv::Point2f>(static_cast<int>(i) * 4 + k, 0);
      const sc::NormalizedPoint n{std::clamp((p.x + static_cast<float>(region.x)) / fw, 0.f, 1.f),
                                  std::clamp((p.y + static_cast<float>(region.y)) / fh, 0.f, 1.f)};
      event.corners[static_cast<std::size_t>(k)] = n;
      x0 = std::min(x0, n.x);
      y0 = std::min(y0, n.y);
      x1 = std::max(x1, n.x);
      y1 = std::max(y1, n.y);
    }
    event.bounds = sc::rect_from_corners({x0, y0}, {x1, y1});
    out.push_back(std::move(event));
  }
  return out;
}

}  // namespace scanbox::vision
