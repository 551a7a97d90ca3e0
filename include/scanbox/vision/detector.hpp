#pragma once

#include <scanbox/core/detection.hpp>
#include <scanbox/core/error.hpp>
#include <scanbox/core/frame.hpp>
#include <scanbox/core/geometry.hpp>
#include <expected>
#include <optional>
#include <vector>

namespace scanbox::vision {

/// Abstract symbol detector: Frame (+ optional region of interest) -> detection batch.
/// Implement detect(); optionally override validate_input.
class IDetector {
 public:
  virtual ~IDetector() = default;

  /// Candidates found inside \p roi (nullopt = whole frame), in detector order.
  /// Coordinates are normalized to the full frame, not to the region.
  [[nodiscard]] virtual std::expected<std::vector<scanbox::core::DetectionEvent>,
                                      scanbox::core::ScanError>
  detect(const scanbox::core::Frame& input,
         std::optional<scanbox::core::NormalizedRect> roi) = 0;

  /// Optional: validate frame format/dimensions before detect. Default: reject empty frames.
  [[nodiscard]] virtual std::expected<void, scanbox::core::ScanError>
  validate_input(const scanbox::core::Frame& input) const {
    if (input.empty()) {
      return std::unexpected(scanbox::core::ScanError::InvalidFrame);
    }
    return {};
  }
};

}  // namespace scanbox::vision
