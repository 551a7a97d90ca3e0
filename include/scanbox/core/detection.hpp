#pragma once

#include <scanbox/core/geometry.hpp>
#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace scanbox::core {

/// Type tag reported for QR codes.
inline constexpr std::string_view kQrTypeTag = "QR";

/// One candidate code reported by the detector for a frame.
/// content is empty/nullopt when the symbol was located but not decodable.
struct DetectionEvent {
  std::string type_tag;
  std::optional<std::string> content;
  NormalizedRect bounds{};
  std::array<NormalizedPoint, 4> corners{};  // quadrilateral as reported, frame-normalized
};

/// True if \p event carries decoded content and matches \p target_symbology
/// (nullopt accepts any type tag).
[[nodiscard]] bool qualifies(const DetectionEvent& event,
                             const std::optional<std::string>& target_symbology) noexcept;

/// First qualifying event of \p batch in arrival order; the rest of the batch is ignored.
[[nodiscard]] std::optional<DetectionEvent> select_detection(
    std::span<const DetectionEvent> batch,
    const std::optional<std::string>& target_symbology);

}  // namespace scanbox::core
