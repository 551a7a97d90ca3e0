#pragma once

#include <scanbox/app/serial_executor.hpp>
#include <scanbox/core/capture_control.hpp>
#include <scanbox/core/detection.hpp>
#include <scanbox/core/error.hpp>
#include <scanbox/core/geometry.hpp>
#include <scanbox/core/scan_session.hpp>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scanbox::app {

/// Completion for configure_region(); runs on the executor thread.
using RegionConfiguredCallback =
    std::function<void(std::expected<scanbox::core::NormalizedRect, scanbox::core::ScanError>)>;

/// Thread-safe front for a ScanSession: every call is posted to the executor,
/// so calls from any thread reach the session serialized and in call order.
/// A stop() that lands before an in-flight batch makes the session drop that batch.
///
/// Capture sources running on other threads can use the controller as their sink;
/// the session then arms and disarms them from the executor thread.
/// Session and executor are not owned; the executor must be flushed or shut
/// down before the session is destroyed.
class ScanController : public scanbox::core::IDetectionSink {
 public:
  ScanController(scanbox::core::ScanSession& session, SerialExecutor& executor);

  void start();
  void stop();
  void configure_region(scanbox::core::DisplaySize display,
                        RegionConfiguredCallback done = {});
  void on_orientation_changed(scanbox::core::Orientation orientation);

  /// Copies \p events and posts them to the session.
  void on_detection_batch(std::span<const scanbox::core::DetectionEvent> events) override;
  void on_setup_failed(std::string message) override;

  /// Session state as seen after every previously posted call has run.
  [[nodiscard]] scanbox::core::SessionState state();

 private:
  void dispatch(std::string_view what, std::function<void()> task);

  scanbox::core::ScanSession& session_;
  SerialExecutor& executor_;
};

}  // namespace scanbox::app
