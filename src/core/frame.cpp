#include <scanbox/core/frame.hpp>

namespace scanbox::core {

std::size_t bytes_per_pixel(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    default:
      return 0;
  }
}

bool Frame::valid() const noexcept {
  const std::size_t row_bytes = static_cast<std::size_t>(width_) * bytes_per_pixel(format_);
  if (row_bytes == 0 || height_ == 0 || stride_ < row_bytes) return false;
  // The last row need not carry padding.
  return buffer_.size() >= stride_ * (height_ - 1) + row_bytes;
}

std::span<const std::byte> Frame::row(std::uint32_t y) const noexcept {
  if (!valid() || y >= height_) return {};
  const std::size_t row_bytes = static_cast<std::size_t>(width_) * bytes_per_pixel(format_);
  return std::span<const std::byte>(buffer_).subspan(stride_ * y, row_bytes);
}

}  // namespace scanbox::core
