#include <scanbox/vision/mock_detector.hpp>
#include <scanbox/core/error.hpp>
#include <vector>

namespace scanbox::vision {

void MockDetector::set_events(std::vector<scanbox::core::DetectionEvent> events) {
  events_to_return_ = std::move(events);
}

std::expected<std::vector<scanbox::core::DetectionEvent>, scanbox::core::ScanError>
MockDetector::detect(const scanbox::core::Frame& input,
                     std::optional<scanbox::core::NormalizedRect> roi) {
  ++calls_;
  last_roi_ = roi;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (!roi) return events_to_return_;

  std::vector<scanbox::core::DetectionEvent> out;
  for (const auto& e : events_to_return_) {
    const scanbox::core::NormalizedPoint center{e.bounds.x + e.bounds.width * 0.5f,
                                                e.bounds.y + e.bounds.height * 0.5f};
    if (roi->contains(center)) out.push_back(e);
  }
  return out;
}

}  // namespace scanbox::vision
