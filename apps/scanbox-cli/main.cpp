/**
 * scanbox-cli: scan QR codes from a camera, video file or still image through a centered scan box.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/scanbox-cli/scanbox_cli [--config path] [--camera N | --input path | --image path]
 * Each accepted code is printed on its own line. Exit code: 0 if at least one code was
 * captured, 1 on bad arguments or capture setup failure, 2 if nothing was captured.
 */

#include <scanbox/app/config.hpp>
#include <scanbox/core/error.hpp>
#include <scanbox/core/frame.hpp>
#include <scanbox/core/geometry.hpp>
#include <scanbox/core/scan_session.hpp>
#include <scanbox/vision/aspect_fill_display.hpp>
#include <scanbox/vision/qr_detector.hpp>
#include <scanbox/vision/still_image.hpp>
#include <scanbox/vision/video_capture_source.hpp>
#include <opencv2/core/utils/logger.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace {

void print_usage() {
  std::cout << "Usage: scanbox_cli [options]\n"
            << "  --config <path>        Scanner config (key=value file); default: built-in\n"
            << "  --camera <index>       Camera device index (default 0)\n"
            << "  --input <path>         Video file or stream URL instead of a camera\n"
            << "  --image <path>         Scan a single still image\n"
            << "  --box <points>         Scan box side in display points (default 200)\n"
            << "  --display <W>x<H>      Preview view size; default: frame size as shown\n"
            << "  --orientation <o>      portrait | portrait_upside_down | landscape_left | landscape_right\n"
            << "  --symbology <tag>      Accepted type tag (default QR; 'any' accepts all)\n"
            << "  --resume               Keep scanning after a capture\n"
            << "  --max <n>              With --resume: stop after n captures (0 = unlimited)\n"
            << "  --verbose              Debug logging\n";
}

bool parse_display(const std::string& text, float& w, float& h) {
  const auto x = text.find('x');
  if (x == std::string::npos) return false;
  w = std::stof(text.substr(0, x));
  h = std::stof(text.substr(x + 1));
  return w > 0.f && h > 0.f;
}

/// View size used when none is configured: the frame as shown in \p orientation.
scanbox::core::DisplaySize shown_frame_size(scanbox::vision::FrameSize frame,
                                            scanbox::core::Orientation orientation) {
  const bool portrait = orientation == scanbox::core::Orientation::Portrait ||
                        orientation == scanbox::core::Orientation::PortraitUpsideDown;
  const float w = static_cast<float>(portrait ? frame.height : frame.width);
  const float h = static_cast<float>(portrait ? frame.width : frame.height);
  return {w, h};
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace sc = scanbox::core;
  namespace sv = scanbox::vision;
  namespace sa = scanbox::app;

  std::string config_path;
  std::string image_path;
  std::optional<int> camera_override;
  std::string input_override;
  std::optional<std::uint32_t> box_override;
  std::optional<std::string> display_override;
  std::optional<std::string> orientation_override;
  std::optional<std::string> symbology_override;
  std::optional<std::uint32_t> max_override;
  bool resume = false;
  bool verbose = false;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--camera" && i + 1 < argc) {
        camera_override = std::stoi(argv[++i]);
      } else if (arg == "--input" && i + 1 < argc) {
        input_override = argv[++i];
      } else if (arg == "--image" && i + 1 < argc) {
        image_path = argv[++i];
      } else if (arg == "--box" && i + 1 < argc) {
        box_override = static_cast<std::uint32_t>(std::stoul(argv[++i]));
      } else if (arg == "--display" && i + 1 < argc) {
        display_override = argv[++i];
      } else if (arg == "--orientation" && i + 1 < argc) {
        orientation_override = argv[++i];
      } else if (arg == "--symbology" && i + 1 < argc) {
        symbology_override = argv[++i];
      } else if (arg == "--max" && i + 1 < argc) {
        max_override = static_cast<std::uint32_t>(std::stoul(argv[++i]));
      } else if (arg == "--resume") {
        resume = true;
      } else if (arg == "--verbose") {
        verbose = true;
      } else if (arg == "--help" || arg == "-h") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown argument " << arg << " (see --help)\n";
        return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Bad argument value: " << e.what() << "\n";
    return 1;
  }

  cv::utils::logging::setLogLevel(verbose ? cv::utils::logging::LOG_LEVEL_DEBUG
                                          : cv::utils::logging::LOG_LEVEL_WARNING);

  sa::ScannerConfig cfg;
  try {
    cfg = config_path.empty() ? sa::default_config() : sa::load_config(config_path);
    if (camera_override) cfg.camera_index = *camera_override;
    if (!input_override.empty()) cfg.input_path = input_override;
    if (box_override) cfg.box_size = *box_override;
    if (display_override &&
        !parse_display(*display_override, cfg.display_width, cfg.display_height)) {
      std::cerr << "Bad --display " << *display_override << " (expected WxH)\n";
      return 1;
    }
    if (orientation_override) {
      auto o = sa::parse_orientation(*orientation_override);
      if (!o) {
        std::cerr << "Unknown --orientation " << *orientation_override << "\n";
        return 1;
      }
      cfg.orientation = *o;
    }
    if (symbology_override) {
      cfg.target_symbology = *symbology_override == "any"
                                 ? std::nullopt
                                 : std::optional<std::string>(*symbology_override);
    }
    if (resume) cfg.resume_after_capture = true;
    if (max_override) cfg.max_captures = *max_override;
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  std::uint32_t captures = 0;
  bool setup_failed = false;

  sc::ScanCallbacks callbacks;
  callbacks.on_capture = [&](const std::string& content) {
    ++captures;
    std::cout << content << "\n";
    if (!cfg.resume_after_capture) return true;
    return cfg.max_captures != 0 && captures >= cfg.max_captures;
  };
  callbacks.on_fail = [&](sc::ScanError error, const std::string& message) {
    if (error == sc::ScanError::SetupFailed) setup_failed = true;
    std::cerr << sc::to_string(error) << ": " << message << "\n";
  };
  callbacks.on_warning = [](sc::ScanError warning) {
    std::cerr << "Warning: " << sc::to_string(warning) << "\n";
  };

  sv::VideoCaptureSource::Options capture_options;
  capture_options.camera_index = cfg.camera_index;
  capture_options.path = cfg.input_path;
  capture_options.width_hint = cfg.frame_width;
  capture_options.height_hint = cfg.frame_height;
  sv::VideoCaptureSource source(capture_options, std::make_unique<sv::QrDetector>());

  sv::AspectFillDisplay display({cfg.display_width, cfg.display_height}, {}, cfg.orientation);
  sc::ScanSession session(source, display, sa::to_session_config(cfg), std::move(callbacks));
  source.set_sink(&session);

  std::optional<sc::Frame> still;
  if (!image_path.empty()) {
    auto image = sv::read_still_image(image_path);
    if (!image) {
      std::cerr << "Failed to load image " << image_path << ": " << sc::to_string(image.error())
                << "\n";
      return 1;
    }
    still = std::move(*image);
    display.set_frame_size({still->width(), still->height()});
  } else {
    if (!source.open()) {
      return 1;
    }
    display.set_frame_size(source.frame_size());
  }

  if (!display.view_size().known()) {
    display.set_view_size(shown_frame_size(display.frame_size(), cfg.orientation));
  }
  session.on_orientation_changed(cfg.orientation);
  auto roi = session.configure_region(display.view_size());
  if (!roi) {
    std::cerr << "Scan region not applied: " << sc::to_string(roi.error()) << "\n";
  }

  session.start();
  if (still) {
    source.process_frame(*still);
  } else {
    while (session.state() == sc::SessionState::Scanning && source.process_next_frame()) {
    }
  }
  session.stop();

  if (setup_failed) return 1;
  return captures > 0 ? 0 : 2;
}
