#include <scanbox/core/error.hpp>
#include <scanbox/core/frame.hpp>
#include <scanbox/vision/still_image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace sv = scanbox::vision;
namespace sc = scanbox::core;

namespace {

class StillImageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() /
           (std::string("scanbox_still_") + info->name());
    std::filesystem::create_directories(dir_);
  }
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string write(const std::string& name, const cv::Mat& image) {
    const auto path = (dir_ / name).string();
    EXPECT_TRUE(cv::imwrite(path, image));
    return path;
  }

  std::filesystem::path dir_;
};

}  // namespace

TEST_F(StillImageTest, ColorImageIsBgr) {
  const auto path = write("color.png", cv::Mat(30, 40, CV_8UC3, cv::Scalar(10, 20, 30)));
  auto frame = sv::read_still_image(path);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 40u);
  EXPECT_EQ(frame->height(), 30u);
  EXPECT_EQ(frame->format(), sc::PixelFormat::BGR8);
  EXPECT_TRUE(frame->valid());
  EXPECT_EQ(frame->row(0)[2], std::byte{30});
}

TEST_F(StillImageTest, GrayImageStaysSingleChannel) {
  const auto path = write("gray.png", cv::Mat(8, 8, CV_8UC1, cv::Scalar(128)));
  auto frame = sv::read_still_image(path);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->format(), sc::PixelFormat::Grayscale8);
}

TEST_F(StillImageTest, SixteenBitImageRejected) {
  const auto path = write("deep.png", cv::Mat(8, 8, CV_16UC1, cv::Scalar(1000)));
  auto frame = sv::read_still_image(path);
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error(), sc::ScanError::InvalidFrame);
}

TEST(StillImage, MissingFileIsSetupFailure) {
  auto frame = sv::read_still_image("/nonexistent/scanbox/code.png");
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error(), sc::ScanError::SetupFailed);
}
