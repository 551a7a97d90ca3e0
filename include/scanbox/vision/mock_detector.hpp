#pragma once

#include <scanbox/vision/detector.hpp>
#include <scanbox/core/detection.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace scanbox::vision {

/// Mock detector that returns a configurable batch (for tests/demo).
/// Events outside the requested region are filtered out, as a real detector would.
class MockDetector : public IDetector {
 public:
  /// Set events to return on next detect() call(s).
  void set_events(std::vector<scanbox::core::DetectionEvent> events);

  [[nodiscard]] std::expected<std::vector<scanbox::core::DetectionEvent>,
                              scanbox::core::ScanError>
  detect(const scanbox::core::Frame& input,
         std::optional<scanbox::core::NormalizedRect> roi) override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_; }
  [[nodiscard]] const std::optional<scanbox::core::NormalizedRect>& last_roi() const noexcept {
    return last_roi_;
  }

 private:
  std::vector<scanbox::core::DetectionEvent> events_to_return_;
  std::optional<scanbox::core::NormalizedRect> last_roi_;
  std::size_t calls_{0};
};

}  // namespace scanbox::vision
