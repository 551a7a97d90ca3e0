#include <scanbox/core/detection.hpp>
#include <algorithm>

namespace scanbox::core {

bool qualifies(const DetectionEvent& event,
               const std::optional<std::string>& target_symbology) noexcept {
  if (!event.content.has_value() || event.content->empty()) return false;
  return !target_symbology.has_value() || event.type_tag == *target_symbology;
}

std::optional<DetectionEvent> select_detection(
    std::span<const DetectionEvent> batch,
    const std::optional<std::string>& target_symbology) {
  const auto it = std::find_if(batch.begin(), batch.end(), [&](const DetectionEvent& e) {
    return qualifies(e, target_symbology);
  });
  if (it == batch.end()) return std::nullopt;
  return *it;
}

}  // namespace scanbox::core
