#pragma once

#include <scanbox/core/detection.hpp>
#include <scanbox/core/geometry.hpp>
#include <optional>
#include <span>
#include <string>

namespace scanbox::core {

/// Capture side of the boundary: what the session drives.
/// arm() starts delivering batches to the sink, restricted to \p roi
/// (nullopt = full frame); disarm() stops delivery until the next arm().
/// Both are called on the session's context, which may differ from the thread
/// the source processes frames on; implementations synchronize accordingly.
class ICaptureControl {
 public:
  virtual ~ICaptureControl() = default;

  virtual void arm(std::optional<NormalizedRect> roi) = 0;
  virtual void disarm() = 0;
};

/// Receiving side of the boundary: what capture sources call.
/// Batches arrive exactly once per processed frame while armed; a setup
/// failure is reported at most once, at initialization.
class IDetectionSink {
 public:
  virtual ~IDetectionSink() = default;

  virtual void on_detection_batch(std::span<const DetectionEvent> events) = 0;
  virtual void on_setup_failed(std::string message) = 0;
};

}  // namespace scanbox::core
