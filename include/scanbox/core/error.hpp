#pragma once

#include <string_view>

namespace scanbox::core {

/// Scan error codes; used with std::expected for recoverable failures and
/// passed to the failure/warning hooks for asynchronous ones.
enum class ScanError {
  None = 0,
  GeometryUnavailable,  // display size not known yet; retry after layout
  RegionNotConfigured,  // non-fatal; scanning proceeds full-frame
  SetupFailed,          // capture device/input could not be acquired
  CallbackFailure,      // a caller hook threw; logged, state unaffected
  InvalidConfig,
  InvalidFrame,
  DetectorFailed,
};

[[nodiscard]] std::string_view to_string(ScanError error) noexcept;

}  // namespace scanbox::core
