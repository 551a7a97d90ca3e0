#include <scanbox/app/config.hpp>
#include <fstream>
#include <string_view>

namespace scanbox::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value) {
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<std::string> parse_symbology(const std::string& value) {
  if (value.empty() || value == "any" || value == "*") return std::nullopt;
  return value;
}

}  // namespace

ScannerConfig default_config() {
  return ScannerConfig{};
}

std::optional<scanbox::core::Orientation> parse_orientation(std::string_view text) {
  using scanbox::core::Orientation;
  if (text == "portrait") return Orientation::Portrait;
  if (text == "portrait_upside_down") return Orientation::PortraitUpsideDown;
  if (text == "landscape_left") return Orientation::LandscapeLeft;
  if (text == "landscape_right") return Orientation::LandscapeRight;
  return std::nullopt;
}

scanbox::core::ScanSessionConfig to_session_config(const ScannerConfig& config) {
  scanbox::core::ScanSessionConfig s;
  s.region = scanbox::core::ScanRegion::square(config.box_size);
  s.target_symbology = config.target_symbology;
  return s;
}

ScannerConfig load_config(const std::string& path) {
  ScannerConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "box_size") c.box_size = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "target_symbology") c.target_symbology = parse_symbology(value);
    else if (key == "camera_index") c.camera_index = std::stoi(value);
    else if (key == "input_path") c.input_path = value;
    else if (key == "frame_width") c.frame_width = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "frame_height") c.frame_height = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "display_width") c.display_width = std::stof(value);
    else if (key == "display_height") c.display_height = std::stof(value);
    else if (key == "orientation") {
      if (auto o = parse_orientation(value)) c.orientation = *o;
    }
    else if (key == "resume_after_capture") c.resume_after_capture = parse_bool(value);
    else if (key == "max_captures") c.max_captures = static_cast<std::uint32_t>(std::stoul(value));
  }
  return c;
}

}  // namespace scanbox::app
