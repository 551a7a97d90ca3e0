#pragma once

#include <scanbox/core/capture_control.hpp>
#include <scanbox/core/frame.hpp>
#include <scanbox/core/geometry.hpp>
#include <scanbox/vision/aspect_fill_display.hpp>
#include <scanbox/vision/detector.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace scanbox::vision {

/// Capture collaborator over cv::VideoCapture: a camera index or a file/stream path.
///
/// Frames are processed on one capture thread: the owner drives
/// process_next_frame() (or process_frame() for externally supplied frames).
/// arm() and disarm() may come from another thread, such as a ScanController
/// executor; a frame already past the armed check still delivers its batch.
/// While armed, each processed frame yields exactly one on_detection_batch()
/// call; while disarmed, frames are read and discarded.
class VideoCaptureSource : public scanbox::core::ICaptureControl {
 public:
  struct Options {
    int camera_index{0};
    std::string path;  // non-empty: open this file/stream instead of the camera
    std::uint32_t width_hint{0};
    std::uint32_t height_hint{0};
  };

  VideoCaptureSource(Options options, std::unique_ptr<IDetector> detector);
  ~VideoCaptureSource() override;

  VideoCaptureSource(const VideoCaptureSource&) = delete;
  VideoCaptureSource& operator=(const VideoCaptureSource&) = delete;

  /// Sink receiving batches and the setup failure. Not owned.
  void set_sink(scanbox::core::IDetectionSink* sink) noexcept { sink_ = sink; }

  /// Opens the device. On failure reports on_setup_failed() to the sink (once) and returns false.
  bool open();
  [[nodiscard]] bool is_open() const;

  /// Size of the frames produced; zero until open() succeeds.
  [[nodiscard]] FrameSize frame_size() const noexcept { return frame_size_; }

  /// Reads one frame and processes it. Returns false at end of stream or when not open.
  bool process_next_frame();

  /// Runs detection on \p frame if armed and delivers the batch.
  void process_frame(const scanbox::core::Frame& frame);

  void arm(std::optional<scanbox::core::NormalizedRect> roi) override;
  void disarm() override;

  [[nodiscard]] bool armed() const noexcept { return armed_.load(); }
  [[nodiscard]] std::optional<scanbox::core::NormalizedRect> roi() const;
  [[nodiscard]] std::uint64_t frames_processed() const noexcept { return frames_processed_.load(); }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  Options options_;
  std::unique_ptr<IDetector> detector_;
  scanbox::core::IDetectionSink* sink_{nullptr};
  FrameSize frame_size_;
  mutable std::mutex roi_mutex_;
  std::optional<scanbox::core::NormalizedRect> roi_;
  std::atomic<bool> armed_{false};
  bool setup_reported_{false};
  std::atomic<std::uint64_t> frames_processed_{0};
};

}  // namespace scanbox::vision
