#pragma once

#include <scanbox/core/error.hpp>
#include <scanbox/core/geometry.hpp>
#include <cstdint>
#include <expected>
#include <functional>

namespace scanbox::core {

/// Size of the scan box in display points; centered in the display.
struct ScanRegion {
  std::uint32_t width{0};
  std::uint32_t height{0};

  [[nodiscard]] static constexpr ScanRegion square(std::uint32_t side) noexcept {
    return {side, side};
  }
};

/// Display -> detector transform owned by the video-display layer.
using FrameRectFn = std::function<NormalizedRect(const DisplayRect&)>;

/// Rectangle of the given size centered in \p display.
/// GeometryUnavailable if the display size is not known yet (zero/negative);
/// InvalidConfig if either box dimension is zero.
/// No clamping: a box larger than the display keeps its center and extends past
/// the display edges. The display layer clips when mapping to frame space.
[[nodiscard]] std::expected<DisplayRect, ScanError> compute_scan_region(
    DisplaySize display, ScanRegion region);

/// Square convenience overload.
[[nodiscard]] std::expected<DisplayRect, ScanError> compute_scan_region(
    DisplaySize display, std::uint32_t box_size);

/// Hands \p display_rect to \p frame_rect_for and returns its result unchanged.
/// GeometryUnavailable if no transform is supplied.
[[nodiscard]] std::expected<NormalizedRect, ScanError> map_to_normalized(
    const DisplayRect& display_rect, const FrameRectFn& frame_rect_for);

}  // namespace scanbox::core
