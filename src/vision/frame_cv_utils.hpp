#pragma once

#include <scanbox/core/frame.hpp>
#include <scanbox/core/geometry.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace scanbox::vision::detail {

/// cv::Mat header over the frame's pixels (no copy). Nullopt unless frame.valid().
std::optional<cv::Mat> frame_to_mat(const scanbox::core::Frame& frame);

/// Frame format for an 8-bit OpenCV image (BGR channel order); nullopt otherwise.
std::optional<scanbox::core::PixelFormat> format_for(const cv::Mat& mat);

/// Copy \p mat into a Frame, keeping its row step.
scanbox::core::Frame mat_to_frame(const cv::Mat& mat,
                                  scanbox::core::PixelFormat format);

/// Single-channel view or converted copy suitable for symbol detection.
std::optional<cv::Mat> to_gray(const scanbox::core::Frame& frame);

/// Pixel rectangle covered by \p roi in an image of \p size, clipped to the image.
cv::Rect roi_to_pixels(const scanbox::core::NormalizedRect& roi, cv::Size size);

}  // namespace scanbox::vision::detail
