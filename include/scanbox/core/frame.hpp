#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace scanbox::core {

/// Pixel layout of a captured frame. 8 bits per channel throughout.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Bytes per pixel for \p format; 0 for Unknown.
[[nodiscard]] std::size_t bytes_per_pixel(PixelFormat format) noexcept;

/// One video frame in sensor orientation, as handed to a detector.
///
/// The frame owns its pixels. Rows may be padded by the capture backend:
/// stride() is the distance between row starts and defaults to the packed
/// row size. Frames move cheaply; copying one copies the buffer.
class Frame {
 public:
  Frame() = default;

  /// Packed rows.
  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : Frame(width, height, format, width * bytes_per_pixel(format), std::move(buffer)) {}

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::size_t stride,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        stride_(stride),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::size_t stride() const noexcept { return stride_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept { return buffer_; }

  /// Pixels of row \p y, without padding. Empty if the frame is not valid().
  [[nodiscard]] std::span<const std::byte> row(std::uint32_t y) const noexcept;

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Known format, non-zero size, stride covers a row, buffer covers every row.
  [[nodiscard]] bool valid() const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::size_t stride_{0};
  std::vector<std::byte> buffer_;
};

}  // namespace scanbox::core
