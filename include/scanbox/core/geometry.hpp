#pragma once

#include <cstdint>
#include <string_view>

namespace scanbox::core {

/// Size of the display (view / superview) in display points.
struct DisplaySize {
  float width{0.f};
  float height{0.f};

  [[nodiscard]] bool known() const noexcept { return width > 0.f && height > 0.f; }
};

/// Axis-aligned rectangle in display points; origin top-left.
/// Origin may be negative when the rectangle overflows the display.
struct DisplayRect {
  float x{0.f};
  float y{0.f};
  float width{0.f};
  float height{0.f};

  [[nodiscard]] float center_x() const noexcept { return x + width * 0.5f; }
  [[nodiscard]] float center_y() const noexcept { return y + height * 0.5f; }
};

/// Point in the detector's normalized frame space (0–1, origin top-left).
struct NormalizedPoint {
  float x{0.f};
  float y{0.f};
};

/// Region of interest in the detector's normalized frame space (0–1, origin
/// top-left, axes independent of device rotation).
struct NormalizedRect {
  float x{0.f};
  float y{0.f};
  float width{1.f};
  float height{1.f};

  /// Whole frame.
  [[nodiscard]] static constexpr NormalizedRect full() noexcept { return {0.f, 0.f, 1.f, 1.f}; }

  [[nodiscard]] bool contains(NormalizedPoint p) const noexcept {
    return p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height;
  }
};

/// Orientation of the output frame relative to the display.
enum class Orientation : std::uint8_t {
  Portrait,
  PortraitUpsideDown,
  LandscapeLeft,
  LandscapeRight,
};

[[nodiscard]] std::string_view to_string(Orientation orientation) noexcept;

/// True when every component lies in [0,1] and the rect does not leave the unit square.
[[nodiscard]] bool is_normalized(const NormalizedRect& rect) noexcept;

/// Intersection of \p rect with the unit square (empty rects collapse to zero size).
[[nodiscard]] NormalizedRect clamp_to_unit(const NormalizedRect& rect) noexcept;

/// Smallest NormalizedRect containing both corners, regardless of their order.
[[nodiscard]] NormalizedRect rect_from_corners(NormalizedPoint a, NormalizedPoint b) noexcept;

}  // namespace scanbox::core
