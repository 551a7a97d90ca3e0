#pragma once

#include <scanbox/core/capture_control.hpp>
#include <scanbox/core/detection.hpp>
#include <scanbox/core/display_mapper.hpp>
#include <scanbox/core/error.hpp>
#include <scanbox/core/geometry.hpp>
#include <scanbox/core/region_mapper.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace scanbox::core {

enum class SessionState : std::uint8_t {
  Idle,
  Scanning,
  HaltedOnDetection,
};

[[nodiscard]] std::string_view to_string(SessionState state) noexcept;

/// Caller hooks. Any subset may be replaced; the rest keep these defaults:
/// on_fail no-op, on_capture accepts and halts, before_start / after_stop /
/// on_warning no-op.
struct ScanCallbacks {
  /// Asynchronous failures (SetupFailed, CallbackFailure) with a description.
  std::function<void(ScanError, const std::string&)> on_fail =
      [](ScanError, const std::string&) {};
  /// Decoded content of the selected detection. Return true to halt, false to resume.
  std::function<bool(const std::string&)> on_capture = [](const std::string&) { return true; };
  /// Immediately before the detector is armed.
  std::function<void()> before_start = [] {};
  /// Immediately after the detector is disarmed.
  std::function<void()> after_stop = [] {};
  /// Non-fatal conditions raised synchronously by start() (RegionNotConfigured).
  std::function<void(ScanError)> on_warning = [](ScanError) {};
};

struct ScanSessionConfig {
  ScanRegion region{ScanRegion::square(200)};
  /// Type tag a detection must carry; nullopt accepts any.
  std::optional<std::string> target_symbology;
};

/// Scan lifecycle state machine: Idle -> Scanning -> HaltedOnDetection -> (Scanning | Idle).
///
/// Not thread-safe: every call (including the IDetectionSink ones made by the
/// capture source) must arrive on one serial context. See app::ScanController
/// for a marshaling wrapper.
///
/// The capture and display collaborators are not owned and must outlive the session.
class ScanSession : public IDetectionSink {
 public:
  ScanSession(ICaptureControl& capture,
              IDisplayMapper& display,
              ScanSessionConfig config = {},
              ScanCallbacks callbacks = {});

  /// Idle/HaltedOnDetection -> Scanning. No-op while Scanning.
  /// Without a configured region the detector is armed full-frame and
  /// on_warning(RegionNotConfigured) is raised before arming.
  void start();

  /// Any state -> Idle. No-op while Idle.
  void stop();

  /// Lays the scan box out in \p display and maps it through the display layer.
  /// On error the previous region (if any) is kept.
  [[nodiscard]] std::expected<NormalizedRect, ScanError> configure_region(DisplaySize display);

  /// Replaces the box size; re-lays out against the last known display size, if any.
  [[nodiscard]] std::expected<NormalizedRect, ScanError> set_scan_region(ScanRegion region);

  void set_target_symbology(std::optional<std::string> target);

  /// Forwards to the display layer and re-maps the region. Session state is unchanged;
  /// the new region is applied on the next arm.
  void on_orientation_changed(Orientation orientation);

  void on_detection_batch(std::span<const DetectionEvent> events) override;
  void on_setup_failed(std::string message) override;

  /// First event matching the configured symbology with non-empty content.
  [[nodiscard]] std::optional<DetectionEvent> select_detection(
      std::span<const DetectionEvent> batch) const;

  [[nodiscard]] SessionState state() const noexcept { return state_; }
  [[nodiscard]] const std::optional<NormalizedRect>& region_of_interest() const noexcept {
    return roi_;
  }
  [[nodiscard]] const std::optional<DisplayRect>& display_region() const noexcept {
    return display_rect_;
  }
  [[nodiscard]] const std::optional<DetectionEvent>& last_detection() const noexcept {
    return last_detection_;
  }
  [[nodiscard]] bool setup_failed() const noexcept { return setup_failed_; }
  [[nodiscard]] Orientation orientation() const noexcept { return orientation_; }
  [[nodiscard]] const ScanSessionConfig& config() const noexcept { return config_; }

 private:
  std::expected<NormalizedRect, ScanError> remap();
  void arm();
  void disarm();
  void report_failure(ScanError error, const std::string& message);
  bool invoke_hook(std::string_view name, const std::function<void()>& hook);

  ICaptureControl& capture_;
  IDisplayMapper& display_;
  ScanSessionConfig config_;
  ScanCallbacks callbacks_;

  SessionState state_{SessionState::Idle};
  Orientation orientation_{Orientation::Portrait};
  std::optional<DisplaySize> display_size_;
  std::optional<DisplayRect> display_rect_;
  std::optional<NormalizedRect> roi_;
  std::optional<DetectionEvent> last_detection_;
  bool setup_failed_{false};
};

}  // namespace scanbox::core
