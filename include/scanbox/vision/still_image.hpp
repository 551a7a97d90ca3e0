#pragma once

#include <scanbox/core/error.hpp>
#include <scanbox/core/frame.hpp>
#include <expected>
#include <string>

namespace scanbox::vision {

/// Reads an image file as a single frame to scan.
/// Errors: SetupFailed if the file cannot be read or decoded;
/// InvalidFrame for images that are not 8-bit gray, BGR or BGRA.
std::expected<scanbox::core::Frame, scanbox::core::ScanError> read_still_image(
    const std::string& path);

}  // namespace scanbox::vision
