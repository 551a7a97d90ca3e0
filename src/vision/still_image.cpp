#include <scanbox/vision/still_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgcodecs.hpp>

namespace scanbox::vision {

namespace sc = scanbox::core;

std::expected<sc::Frame, sc::ScanError> read_still_image(const std::string& path) {
  cv::Mat image;
  try {
    image = cv::imread(path, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    CV_LOG_WARNING(NULL, "scanbox: cannot decode " << path << ": " << e.what());
    return std::unexpected(sc::ScanError::SetupFailed);
  }
  if (image.empty()) {
    CV_LOG_WARNING(NULL, "scanbox: cannot read image " << path);
    return std::unexpected(sc::ScanError::SetupFailed);
  }

  const auto format = detail::format_for(image);
  if (!format) {
    CV_LOG_WARNING(NULL, "scanbox: unsupported image type " << image.type() << " in " << path);
    return std::unexpected(sc::ScanError::InvalidFrame);
  }
  return detail::mat_to_frame(image, *format);
}

}  // namespace scanbox::vision
