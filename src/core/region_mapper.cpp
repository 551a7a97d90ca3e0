#include <scanbox/core/region_mapper.hpp>

namespace scanbox::core {

std::expected<DisplayRect, ScanError> compute_scan_region(DisplaySize display,
                                                          ScanRegion region) {
  if (!display.known()) {
    return std::unexpected(ScanError::GeometryUnavailable);
  }
  if (region.width == 0 || region.height == 0) {
    return std::unexpected(ScanError::InvalidConfig);
  }

  const float w = static_cast<float>(region.width);
  const float h = static_cast<float>(region.height);
  return DisplayRect{display.width * 0.5f - w * 0.5f,
                     display.height * 0.5f - h * 0.5f, w, h};
}

std::expected<DisplayRect, ScanError> compute_scan_region(DisplaySize display,
                                                          std::uint32_t box_size) {
  return compute_scan_region(display, ScanRegion::square(box_size));
}

std::expected<NormalizedRect, ScanError> map_to_normalized(
    const DisplayRect& display_rect, const FrameRectFn& frame_rect_for) {
  if (!frame_rect_for) {
    return std::unexpected(ScanError::GeometryUnavailable);
  }
  return frame_rect_for(display_rect);
}

}  // namespace scanbox::core
