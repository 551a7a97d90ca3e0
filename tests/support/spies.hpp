#pragma once

#include <scanbox/core/capture_control.hpp>
#include <scanbox/core/display_mapper.hpp>
#include <scanbox/core/geometry.hpp>
#include <scanbox/core/scan_session.hpp>
#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scanbox::testing {

/// Ordered record of collaborator and hook calls, shared by the spies below.
struct CallLog {
  std::vector<std::string> entries;

  void add(std::string entry) { entries.push_back(std::move(entry)); }

  [[nodiscard]] std::size_t count(const std::string& entry) const {
    return static_cast<std::size_t>(std::count(entries.begin(), entries.end(), entry));
  }

  /// Index of the first occurrence, or entries.size() if absent.
  [[nodiscard]] std::size_t index_of(const std::string& entry) const {
    return static_cast<std::size_t>(
        std::find(entries.begin(), entries.end(), entry) - entries.begin());
  }
};

class SpyCapture : public scanbox::core::ICaptureControl {
 public:
  explicit SpyCapture(CallLog& log) : log_(log) {}

  void arm(std::optional<scanbox::core::NormalizedRect> roi) override {
    log_.add("arm");
    armed = true;
    last_roi = roi;
  }
  void disarm() override {
    log_.add("disarm");
    armed = false;
  }

  bool armed{false};
  std::optional<scanbox::core::NormalizedRect> last_roi;

 private:
  CallLog& log_;
};

class SpyDisplay : public scanbox::core::IDisplayMapper {
 public:
  explicit SpyDisplay(CallLog& log) : log_(log) {}

  scanbox::core::NormalizedRect frame_rect_for(
      const scanbox::core::DisplayRect& display_rect) const override {
    log_.add("frame_rect_for");
    last_input = display_rect;
    return result;
  }
  void set_orientation(scanbox::core::Orientation o) override {
    log_.add("set_orientation");
    orientation = o;
  }

  scanbox::core::NormalizedRect result{0.25f, 0.25f, 0.5f, 0.5f};
  mutable std::optional<scanbox::core::DisplayRect> last_input;
  scanbox::core::Orientation orientation{scanbox::core::Orientation::Portrait};

 private:
  CallLog& log_;
};

/// Hooks that log into \p log; on_capture logs "capture:<content>" and returns \p halt.
inline scanbox::core::ScanCallbacks logging_callbacks(CallLog& log, bool halt) {
  scanbox::core::ScanCallbacks cb;
  cb.before_start = [&log] { log.add("before_start"); };
  cb.after_stop = [&log] { log.add("after_stop"); };
  cb.on_capture = [&log, halt](const std::string& content) {
    log.add("capture:" + content);
    return halt;
  };
  cb.on_fail = [&log](scanbox::core::ScanError e, const std::string&) {
    log.add("fail:" + std::string(scanbox::core::to_string(e)));
  };
  cb.on_warning = [&log](scanbox::core::ScanError e) {
    log.add("warning:" + std::string(scanbox::core::to_string(e)));
  };
  return cb;
}

inline scanbox::core::DetectionEvent make_event(std::string type_tag,
                                                std::optional<std::string> content,
                                                scanbox::core::NormalizedRect bounds = {0.4f, 0.4f, 0.2f, 0.2f}) {
  scanbox::core::DetectionEvent e;
  e.type_tag = std::move(type_tag);
  e.content = std::move(content);
  e.bounds = bounds;
  return e;
}

}  // namespace scanbox::testing
