#include <scanbox/vision/aspect_fill_display.hpp>
#include <algorithm>

namespace scanbox::vision {

namespace sc = scanbox::core;

namespace {

bool is_portrait(sc::Orientation o) noexcept {
  return o == sc::Orientation::Portrait || o == sc::Orientation::PortraitUpsideDown;
}

}  // namespace

AspectFillDisplay::AspectFillDisplay(sc::DisplaySize view,
                                     FrameSize frame,
                                     sc::Orientation orientation)
    : view_(view), frame_(frame), orientation_(orientation) {}

sc::NormalizedPoint AspectFillDisplay::view_to_frame(float x, float y) const noexcept {
  // Size of the frame as shown, before scaling.
  const bool rotated = is_portrait(orientation_);
  const float shown_w = static_cast<float>(rotated ? frame_.height : frame_.width);
  const float shown_h = static_cast<float>(rotated ? frame_.width : frame_.height);

  const float scale = std::max(view_.width / shown_w, view_.height / shown_h);
  const float scaled_w = shown_w * scale;
  const float scaled_h = shown_h * scale;
  const float offset_x = (view_.width - scaled_w) * 0.5f;
  const float offset_y = (view_.height - scaled_h) * 0.5f;

  const float u = (x - offset_x) / scaled_w;
  const float v = (y - offset_y) / scaled_h;

  switch (orientation_) {
    case sc::Orientation::Portrait:
      return {v, 1.f - u};
    case sc::Orientation::PortraitUpsideDown:
      return {1.f - v, u};
    case sc::Orientation::LandscapeLeft:
      return {1.f - u, 1.f - v};
    case sc::Orientation::LandscapeRight:
    default:
      return {u, v};
  }
}

sc::NormalizedRect AspectFillDisplay::frame_rect_for(const sc::DisplayRect& display_rect) const {
  if (!view_.known() || frame_.width == 0 || frame_.height == 0) {
    return sc::NormalizedRect::full();
  }
  const auto a = view_to_frame(display_rect.x, display_rect.y);
  const auto b = view_to_frame(display_rect.x + display_rect.width,
                               display_rect.y + display_rect.height);
  return sc::clamp_to_unit(sc::rect_from_corners(a, b));
}

}  // namespace scanbox::vision
