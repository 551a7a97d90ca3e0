#include <scanbox/app/scan_controller.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <utility>

namespace scanbox::app {

namespace sc = scanbox::core;

ScanController::ScanController(sc::ScanSession& session, SerialExecutor& executor)
    : session_(session), executor_(executor) {}

void ScanController::dispatch(std::string_view what, std::function<void()> task) {
  if (!executor_.post(std::move(task))) {
    CV_LOG_WARNING(NULL, "scanbox: " << what << " after executor shutdown ignored");
  }
}

void ScanController::start() {
  dispatch("start", [this] { session_.start(); });
}

void ScanController::stop() {
  dispatch("stop", [this] { session_.stop(); });
}

void ScanController::configure_region(sc::DisplaySize display, RegionConfiguredCallback done) {
  dispatch("configure_region", [this, display, done = std::move(done)] {
    auto result = session_.configure_region(display);
    if (done) done(std::move(result));
  });
}

void ScanController::on_orientation_changed(sc::Orientation orientation) {
  dispatch("on_orientation_changed",
           [this, orientation] { session_.on_orientation_changed(orientation); });
}

void ScanController::on_detection_batch(std::span<const sc::DetectionEvent> events) {
  std::vector<sc::DetectionEvent> batch(events.begin(), events.end());
  dispatch("on_detection_batch",
           [this, batch = std::move(batch)] { session_.on_detection_batch(batch); });
}

void ScanController::on_setup_failed(std::string message) {
  dispatch("on_setup_failed", [this, message = std::move(message)] {
    session_.on_setup_failed(message);
  });
}

sc::SessionState ScanController::state() {
  executor_.flush();
  return session_.state();
}

}  // namespace scanbox::app
