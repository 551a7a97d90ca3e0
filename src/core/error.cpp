#include <scanbox/core/error.hpp>

namespace scanbox::core {

std::string_view to_string(ScanError error) noexcept {
  switch (error) {
    case ScanError::None:
      return "None";
    case ScanError::GeometryUnavailable:
      return "GeometryUnavailable";
    case ScanError::RegionNotConfigured:
      return "RegionNotConfigured";
    case ScanError::SetupFailed:
      return "SetupFailed";
    case ScanError::CallbackFailure:
      return "CallbackFailure";
    case ScanError::InvalidConfig:
      return "InvalidConfig";
    case ScanError::InvalidFrame:
      return "InvalidFrame";
    case ScanError::DetectorFailed:
      return "DetectorFailed";
    default:
      return "Unknown";
  }
}

}  // namespace scanbox::core
