#pragma once

#include <scanbox/core/geometry.hpp>

namespace scanbox::core {

/// Video-display layer: the only component that knows the live video
/// dimensions, orientation and aspect-fill crop.
class IDisplayMapper {
 public:
  virtual ~IDisplayMapper() = default;

  /// Display rect -> detector-space rect, within [0,1].
  [[nodiscard]] virtual NormalizedRect frame_rect_for(const DisplayRect& display_rect) const = 0;

  /// Orientation of the output frame changed; later frame_rect_for() calls use it.
  virtual void set_orientation(Orientation orientation) = 0;
};

}  // namespace scanbox::core
