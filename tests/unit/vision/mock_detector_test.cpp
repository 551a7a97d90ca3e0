#include <scanbox/core/detection.hpp>
#include <scanbox/core/error.hpp>
#include <scanbox/core/frame.hpp>
#include <scanbox/vision/mock_detector.hpp>
#include "support/spies.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace sv = scanbox::vision;
namespace sc = scanbox::core;
using scanbox::testing::make_event;

namespace {

sc::Frame make_frame() {
  std::vector<std::byte> buf(8 * 8 * 3);
  return sc::Frame(8, 8, sc::PixelFormat::BGR8, std::move(buf));
}

}  // namespace

TEST(MockDetector, ReturnsSetEvents) {
  sv::MockDetector mock;
  mock.set_events({make_event("QR", "a"), make_event("QR", std::nullopt)});
  auto result = mock.detect(make_frame(), std::nullopt);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->size(), 2u);
  EXPECT_EQ(*(*result)[0].content, "a");
  EXPECT_EQ(mock.calls(), 1u);
  EXPECT_FALSE(mock.last_roi().has_value());
}

TEST(MockDetector, FiltersByRegion) {
  sv::MockDetector mock;
  mock.set_events({
      make_event("QR", "left", {0.1f, 0.4f, 0.1f, 0.1f}),
      make_event("QR", "right", {0.8f, 0.4f, 0.1f, 0.1f}),
  });
  const sc::NormalizedRect right_half{0.5f, 0.f, 0.5f, 1.f};
  auto result = mock.detect(make_frame(), right_half);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->size(), 1u);
  EXPECT_EQ(*(*result)[0].content, "right");
  ASSERT_TRUE(mock.last_roi().has_value());
  EXPECT_FLOAT_EQ(mock.last_roi()->x, 0.5f);
}

TEST(MockDetector, RejectsEmptyFrame) {
  sv::MockDetector mock;
  auto result = mock.detect(sc::Frame{}, std::nullopt);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::ScanError::InvalidFrame);
}
