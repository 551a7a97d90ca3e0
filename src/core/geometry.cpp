#include <scanbox/core/geometry.hpp>
#include <algorithm>

namespace scanbox::core {

std::string_view to_string(Orientation orientation) noexcept {
  switch (orientation) {
    case Orientation::Portrait:
      return "portrait";
    case Orientation::PortraitUpsideDown:
      return "portrait_upside_down";
    case Orientation::LandscapeLeft:
      return "landscape_left";
    case Orientation::LandscapeRight:
      return "landscape_right";
    default:
      return "unknown";
  }
}

bool is_normalized(const NormalizedRect& rect) noexcept {
  const auto in_unit = [](float v) { return v >= 0.f && v <= 1.f; };
  return in_unit(rect.x) && in_unit(rect.y) && in_unit(rect.width) &&
         in_unit(rect.height) && rect.x + rect.width <= 1.f + 1e-6f &&
         rect.y + rect.height <= 1.f + 1e-6f;
}

NormalizedRect clamp_to_unit(const NormalizedRect& rect) noexcept {
  const float x0 = std::clamp(rect.x, 0.f, 1.f);
  const float y0 = std::clamp(rect.y, 0.f, 1.f);
  const float x1 = std::clamp(rect.x + rect.width, 0.f, 1.f);
  const float y1 = std::clamp(rect.y + rect.height, 0.f, 1.f);
  return {x0, y0, std::max(0.f, x1 - x0), std::max(0.f, y1 - y0)};
}

NormalizedRect rect_from_corners(NormalizedPoint a, NormalizedPoint b) noexcept {
  const float x0 = std::min(a.x, b.x);
  const float y0 = std::min(a.y, b.y);
  return {x0, y0, std::max(a.x, b.x) - x0, std::max(a.y, b.y) - y0};
}

}  // namespace scanbox::core
