#pragma once

#include <scanbox/core/display_mapper.hpp>
#include <scanbox/core/geometry.hpp>
#include <cstdint>

namespace scanbox::vision {

/// Native size of the captured frame in pixels (sensor orientation).
struct FrameSize {
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Display mapper for a preview that shows the video aspect-filled in a view.
///
/// The sensor frame is native in LandscapeRight; Portrait shows it rotated 90°
/// clockwise, PortraitUpsideDown 90° counter-clockwise and LandscapeLeft 180°.
/// The rotated frame is scaled to cover the whole view, centered, and cropped
/// on the overflowing axis. frame_rect_for() inverts that: view points -> sensor
/// normalized coordinates, clipped to [0,1].
class AspectFillDisplay : public scanbox::core::IDisplayMapper {
 public:
  AspectFillDisplay(scanbox::core::DisplaySize view,
                    FrameSize frame,
                    scanbox::core::Orientation orientation =
                        scanbox::core::Orientation::LandscapeRight);

  /// Full frame if the view or frame size is unknown.
  [[nodiscard]] scanbox::core::NormalizedRect frame_rect_for(
      const scanbox::core::DisplayRect& display_rect) const override;

  void set_orientation(scanbox::core::Orientation orientation) override {
    orientation_ = orientation;
  }

  void set_view_size(scanbox::core::DisplaySize view) noexcept { view_ = view; }
  void set_frame_size(FrameSize frame) noexcept { frame_ = frame; }

  [[nodiscard]] scanbox::core::DisplaySize view_size() const noexcept { return view_; }
  [[nodiscard]] FrameSize frame_size() const noexcept { return frame_; }
  [[nodiscard]] scanbox::core::Orientation orientation() const noexcept { return orientation_; }

  /// Point in view coordinates -> sensor-normalized point (unclipped).
  [[nodiscard]] scanbox::core::NormalizedPoint view_to_frame(float x, float y) const noexcept;

 private:
  scanbox::core::DisplaySize view_;
  FrameSize frame_;
  scanbox::core::Orientation orientation_;
};

}  // namespace scanbox::vision
