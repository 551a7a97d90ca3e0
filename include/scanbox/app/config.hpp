#pragma once

#include <scanbox/core/geometry.hpp>
#include <scanbox/core/scan_session.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace scanbox::app {

/// Scanner configuration: capture source, scan box, symbology, resume policy.
struct ScannerConfig {
  std::uint32_t box_size{200};
  std::optional<std::string> target_symbology{"QR"};  // nullopt: accept any type

  int camera_index{0};
  std::string input_path;            // video file / stream URL; empty = camera
  std::uint32_t frame_width{0};      // capture resolution hints; 0 = device default
  std::uint32_t frame_height{0};

  float display_width{0.f};          // preview view size; 0 = same as shown frame
  float display_height{0.f};
  scanbox::core::Orientation orientation{scanbox::core::Orientation::LandscapeRight};

  bool resume_after_capture{false};  // keep scanning after an accepted code
  std::uint32_t max_captures{1};     // with resume: halt after this many (0 = unlimited)
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Missing file -> defaults; unknown keys and '#' comments are ignored.
/// Throws std::invalid_argument / std::out_of_range on malformed numeric values.
ScannerConfig load_config(const std::string& path);

/// Default config when no file is provided.
ScannerConfig default_config();

/// "portrait", "portrait_upside_down", "landscape_left", "landscape_right".
std::optional<scanbox::core::Orientation> parse_orientation(std::string_view text);

/// Session part of the configuration.
scanbox::core::ScanSessionConfig to_session_config(const ScannerConfig& config);

}  // namespace scanbox::app
