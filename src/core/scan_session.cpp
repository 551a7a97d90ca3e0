#include <scanbox/core/scan_session.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <exception>
#include <utility>

namespace scanbox::core {

std::string_view to_string(SessionState state) noexcept {
  switch (state) {
    case SessionState::Idle:
      return "Idle";
    case SessionState::Scanning:
      return "Scanning";
    case SessionState::HaltedOnDetection:
      return "HaltedOnDetection";
    default:
      return "Unknown";
  }
}

ScanSession::ScanSession(ICaptureControl& capture,
                         IDisplayMapper& display,
                         ScanSessionConfig config,
                         ScanCallbacks callbacks)
    : capture_(capture),
      display_(display),
      config_(std::move(config)),
      callbacks_(std::move(callbacks)) {}

void ScanSession::start() {
  if (state_ == SessionState::Scanning) {
    CV_LOG_DEBUG(NULL, "scanbox: start() while scanning ignored");
    return;
  }

  setup_failed_ = false;
  last_detection_.reset();

  if (!roi_) {
    CV_LOG_WARNING(NULL, "scanbox: scan region not configured, scanning full frame");
    invoke_hook("on_warning", [this] {
      if (callbacks_.on_warning) callbacks_.on_warning(ScanError::RegionNotConfigured);
    });
  }

  arm();
  state_ = SessionState::Scanning;
  CV_LOG_INFO(NULL, "scanbox: scanning started");
}

void ScanSession::stop() {
  switch (state_) {
    case SessionState::Idle:
      CV_LOG_DEBUG(NULL, "scanbox: stop() while idle ignored");
      return;
    case SessionState::Scanning:
      state_ = SessionState::Idle;
      disarm();
      break;
    case SessionState::HaltedOnDetection:
      // Detector was already disarmed when the detection was selected.
      state_ = SessionState::Idle;
      break;
  }
  CV_LOG_INFO(NULL, "scanbox: scanning stopped");
}

std::expected<NormalizedRect, ScanError> ScanSession::configure_region(DisplaySize display) {
  auto rect = compute_scan_region(display, config_.region);
  if (!rect) {
    CV_LOG_WARNING(NULL, "scanbox: cannot lay out scan region: " << to_string(rect.error()));
    return std::unexpected(rect.error());
  }
  display_size_ = display;
  display_rect_ = *rect;
  return remap();
}

std::expected<NormalizedRect, ScanError> ScanSession::set_scan_region(ScanRegion region) {
  if (region.width == 0 || region.height == 0) {
    return std::unexpected(ScanError::InvalidConfig);
  }
  config_.region = region;
  if (!display_size_) {
    return std::unexpected(ScanError::GeometryUnavailable);
  }
  return configure_region(*display_size_);
}

void ScanSession::set_target_symbology(std::optional<std::string> target) {
  config_.target_symbology = std::move(target);
}

void ScanSession::on_orientation_changed(Orientation orientation) {
  orientation_ = orientation;
  display_.set_orientation(orientation);
  CV_LOG_INFO(NULL, "scanbox: orientation " << to_string(orientation));
  if (display_rect_) {
    auto mapped = remap();
    if (!mapped) {
      CV_LOG_WARNING(NULL, "scanbox: region re-map failed: " << to_string(mapped.error()));
    }
  }
}

void ScanSession::on_detection_batch(std::span<const DetectionEvent> events) {
  if (state_ != SessionState::Scanning) {
    CV_LOG_DEBUG(NULL, "scanbox: batch of " << events.size() << " dropped in state "
                                            << to_string(state_));
    return;
  }

  auto selected = select_detection(events);
  if (!selected) return;

  last_detection_ = std::move(selected);
  state_ = SessionState::HaltedOnDetection;
  disarm();

  if (state_ != SessionState::HaltedOnDetection) {
    CV_LOG_DEBUG(NULL, "scanbox: session left halted state during after_stop");
    return;
  }

  bool halt = true;
  if (callbacks_.on_capture) {
    try {
      halt = callbacks_.on_capture(*last_detection_->content);
    } catch (const std::exception& e) {
      CV_LOG_ERROR(NULL, "scanbox: on_capture threw: " << e.what());
      report_failure(ScanError::CallbackFailure, e.what());
      halt = true;
    } catch (...) {
      CV_LOG_ERROR(NULL, "scanbox: on_capture threw a non-standard exception");
      report_failure(ScanError::CallbackFailure, "unknown exception");
      halt = true;
    }
  }

  // A start()/stop() issued from inside on_capture takes precedence.
  if (state_ != SessionState::HaltedOnDetection) return;

  if (halt) {
    state_ = SessionState::Idle;
    CV_LOG_INFO(NULL, "scanbox: halted after detection");
  } else {
    arm();
    state_ = SessionState::Scanning;
    CV_LOG_DEBUG(NULL, "scanbox: resumed after detection");
  }
}

void ScanSession::on_setup_failed(std::string message) {
  setup_failed_ = true;
  // Collaborator stays armed: capture never ran, so no disarm/after_stop here;
  // the next start() arms again with a fresh before_start.
  state_ = SessionState::Idle;
  CV_LOG_WARNING(NULL, "scanbox: capture setup failed: " << message);
  report_failure(ScanError::SetupFailed, message);
}

std::optional<DetectionEvent> ScanSession::select_detection(
    std::span<const DetectionEvent> batch) const {
  return core::select_detection(batch, config_.target_symbology);
}

std::expected<NormalizedRect, ScanError> ScanSession::remap() {
  if (!display_rect_) {
    return std::unexpected(ScanError::GeometryUnavailable);
  }
  auto mapped = map_to_normalized(*display_rect_, [this](const DisplayRect& r) {
    return display_.frame_rect_for(r);
  });
  if (!mapped) {
    return std::unexpected(mapped.error());
  }
  if (!is_normalized(*mapped)) {
    CV_LOG_WARNING(NULL, "scanbox: display mapper returned a rect outside [0,1], clamping");
    *mapped = clamp_to_unit(*mapped);
  }
  roi_ = *mapped;
  CV_LOG_DEBUG(NULL, "scanbox: roi x=" << roi_->x << " y=" << roi_->y << " w=" << roi_->width
                                       << " h=" << roi_->height);
  return *mapped;
}

void ScanSession::arm() {
  invoke_hook("before_start", callbacks_.before_start);
  capture_.arm(roi_);
}

void ScanSession::disarm() {
  capture_.disarm();
  invoke_hook("after_stop", callbacks_.after_stop);
}

void ScanSession::report_failure(ScanError error, const std::string& message) {
  if (!callbacks_.on_fail) return;
  try {
    callbacks_.on_fail(error, message);
  } catch (const std::exception& e) {
    CV_LOG_ERROR(NULL, "scanbox: on_fail threw: " << e.what());
  } catch (...) {
    CV_LOG_ERROR(NULL, "scanbox: on_fail threw a non-standard exception");
  }
}

bool ScanSession::invoke_hook(std::string_view name, const std::function<void()>& hook) {
  if (!hook) return true;
  try {
    hook();
    return true;
  } catch (const std::exception& e) {
    CV_LOG_ERROR(NULL, "scanbox: " << name << " threw: " << e.what());
    report_failure(ScanError::CallbackFailure, std::string(name) + ": " + e.what());
    return false;
  } catch (...) {
    CV_LOG_ERROR(NULL, "scanbox: " << name << " threw a non-standard exception");
    report_failure(ScanError::CallbackFailure, std::string(name) + ": unknown exception");
    return false;
  }
}

}  // namespace scanbox::core
