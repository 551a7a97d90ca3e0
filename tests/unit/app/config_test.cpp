#include <scanbox/app/config.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace sa = scanbox::app;
namespace sc = scanbox::core;

namespace {

class ConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path_ = std::filesystem::temp_directory_path() /
            (std::string("scanbox_config_") + info->name() + ".cfg");
  }
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  std::string write(const std::string& text) {
    std::ofstream out(path_);
    out << text;
    return path_.string();
  }

  std::filesystem::path path_;
};

}  // namespace

TEST(Config, DefaultsMatchStockScanner) {
  const auto c = sa::default_config();
  EXPECT_EQ(c.box_size, 200u);
  ASSERT_TRUE(c.target_symbology.has_value());
  EXPECT_EQ(*c.target_symbology, "QR");
  EXPECT_EQ(c.camera_index, 0);
  EXPECT_TRUE(c.input_path.empty());
  EXPECT_EQ(c.orientation, sc::Orientation::LandscapeRight);
  EXPECT_FALSE(c.resume_after_capture);
  EXPECT_EQ(c.max_captures, 1u);
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = sa::load_config("/nonexistent/scanbox/scanner.cfg");
  EXPECT_EQ(c.box_size, 200u);
  EXPECT_EQ(*c.target_symbology, "QR");
}

TEST_F(ConfigFileTest, ParsesAllKeys) {
  const auto path = write(
      "# scanner\n"
      "box_size = 240\n"
      "target_symbology=EAN13\n"
      "camera_index=2\n"
      "input_path = /tmp/clip.mp4\n"
      "frame_width=1280\n"
      "frame_height=720\n"
      "display_width=375\n"
      "display_height=667.5\n"
      "orientation=portrait\n"
      "resume_after_capture=yes\n"
      "max_captures=3\n"
      "unknown_key=whatever\n"
      "not a key value line\n");
  const auto c = sa::load_config(path);
  EXPECT_EQ(c.box_size, 240u);
  EXPECT_EQ(*c.target_symbology, "EAN13");
  EXPECT_EQ(c.camera_index, 2);
  EXPECT_EQ(c.input_path, "/tmp/clip.mp4");
  EXPECT_EQ(c.frame_width, 1280u);
  EXPECT_EQ(c.frame_height, 720u);
  EXPECT_FLOAT_EQ(c.display_width, 375.f);
  EXPECT_FLOAT_EQ(c.display_height, 667.5f);
  EXPECT_EQ(c.orientation, sc::Orientation::Portrait);
  EXPECT_TRUE(c.resume_after_capture);
  EXPECT_EQ(c.max_captures, 3u);
}

TEST_F(ConfigFileTest, AnySymbologyAcceptsAllTypes) {
  EXPECT_FALSE(sa::load_config(write("target_symbology=any\n")).target_symbology.has_value());
  EXPECT_FALSE(sa::load_config(write("target_symbology=*\n")).target_symbology.has_value());
}

TEST_F(ConfigFileTest, UnknownOrientationKeepsDefault) {
  const auto c = sa::load_config(write("orientation=sideways\n"));
  EXPECT_EQ(c.orientation, sc::Orientation::LandscapeRight);
}

TEST_F(ConfigFileTest, MalformedNumberThrows) {
  EXPECT_THROW(sa::load_config(write("box_size=large\n")), std::invalid_argument);
}

TEST(Config, ParseOrientation) {
  EXPECT_EQ(sa::parse_orientation("portrait_upside_down"), sc::Orientation::PortraitUpsideDown);
  EXPECT_EQ(sa::parse_orientation("landscape_left"), sc::Orientation::LandscapeLeft);
  EXPECT_EQ(sa::parse_orientation("landscape_right"), sc::Orientation::LandscapeRight);
  EXPECT_FALSE(sa::parse_orientation("Portrait").has_value());
}

TEST(Config, ToSessionConfigBuildsSquareBox) {
  sa::ScannerConfig c;
  c.box_size = 120;
  c.target_symbology.reset();
  const auto s = sa::to_session_config(c);
  EXPECT_EQ(s.region.width, 120u);
  EXPECT_EQ(s.region.height, 120u);
  EXPECT_FALSE(s.target_symbology.has_value());
}
