#include <scanbox/vision/video_capture_source.hpp>
#include "frame_cv_utils.hpp"
#include <scanbox/core/detection.hpp>
#include <scanbox/core/error.hpp>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/videoio.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace scanbox::vision {

namespace sc = scanbox::core;

struct VideoCaptureSource::Impl {
  cv::VideoCapture capture;
  cv::Mat scratch;
};

VideoCaptureSource::VideoCaptureSource(Options options, std::unique_ptr<IDetector> detector)
    : impl_(std::make_unique<Impl>()),
      options_(std::move(options)),
      detector_(std::move(detector)) {
  if (!detector_) {
    throw std::invalid_argument("VideoCaptureSource: detector is required");
  }
}

VideoCaptureSource::~VideoCaptureSource() = default;

bool VideoCaptureSource::open() {
  bool opened = false;
  std::string what;
  try {
    opened = options_.path.empty() ? impl_->capture.open(options_.camera_index)
                                   : impl_->capture.open(options_.path);
  } catch (const cv::Exception& e) {
    what = e.what();
  }

  if (!opened) {
    const std::string source =
        options_.path.empty() ? "camera " + std::to_string(options_.camera_index) : options_.path;
    const std::string message =
        "cannot open " + source + (what.empty() ? std::string() : ": " + what);
    CV_LOG_WARNING(NULL, "scanbox: " << message);
    if (sink_ && !setup_reported_) {
      setup_reported_ = true;
      sink_->on_setup_failed(message);
    }
    return false;
  }

  if (options_.width_hint > 0) {
    impl_->capture.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(options_.width_hint));
  }
  if (options_.height_hint > 0) {
    impl_->capture.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(options_.height_hint));
  }
  frame_size_.width = static_cast<std::uint32_t>(impl_->capture.get(cv::CAP_PROP_FRAME_WIDTH));
  frame_size_.height = static_cast<std::uint32_t>(impl_->capture.get(cv::CAP_PROP_FRAME_HEIGHT));
  CV_LOG_INFO(NULL, "scanbox: capture opened " << frame_size_.width << "x" << frame_size_.height);
  return true;
}

bool VideoCaptureSource::is_open() const {
  return impl_->capture.isOpened();
}

bool VideoCaptureSource::process_next_frame() {
  if (!impl_->capture.isOpened()) return false;
  if (!impl_->capture.read(impl_->scratch) || impl_->scratch.empty()) {
    return false;
  }
  if (!armed_.load()) return true;

  const auto format = detail::format_for(impl_->scratch);
  if (!format) {
    CV_LOG_WARNING(NULL, "scanbox: unsupported capture frame type " << impl_->scratch.type());
    return true;
  }
  const sc::Frame frame = detail::mat_to_frame(impl_->scratch, *format);
  if (frame_size_.width == 0) {
    frame_size_ = FrameSize{frame.width(), frame.height()};
  }
  process_frame(frame);
  return true;
}

void VideoCaptureSource::process_frame(const sc::Frame& frame) {
  if (!armed_.load()) return;
  const std::uint64_t index = ++frames_processed_;

  std::optional<sc::NormalizedRect> roi;
  {
    std::lock_guard lock(roi_mutex_);
    roi = roi_;
  }
  std::vector<sc::DetectionEvent> events;
  auto detected = detector_->detect(frame, roi);
  if (detected) {
    events = std::move(*detected);
  } else {
    CV_LOG_WARNING(NULL, "scanbox: frame " << index << " not scanned: "
                                           << sc::to_string(detected.error()));
  }
  if (sink_) {
    sink_->on_detection_batch(events);
  }
}

void VideoCaptureSource::arm(std::optional<sc::NormalizedRect> roi) {
  {
    std::lock_guard lock(roi_mutex_);
    roi_ = roi;
  }
  armed_.store(true);
}

void VideoCaptureSource::disarm() {
  armed_.store(false);
}

std::optional<sc::NormalizedRect> VideoCaptureSource::roi() const {
  std::lock_guard lock(roi_mutex_);
  return roi_;
}

}  // namespace scanbox::vision
