#include <scanbox/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace sc = scanbox::core;

TEST(Frame, DefaultIsInvalid) {
  sc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_FALSE(f.valid());
  EXPECT_TRUE(f.row(0).empty());
}

TEST(Frame, PackedStrideFromFormat) {
  sc::Frame f(100, 50, sc::PixelFormat::BGR8, std::vector<std::byte>(100 * 50 * 3));
  EXPECT_EQ(f.stride(), 300u);
  EXPECT_TRUE(f.valid());
  EXPECT_EQ(f.row(49).size(), 300u);
  EXPECT_TRUE(f.row(50).empty());
}

TEST(Frame, PaddedRowsSkipPadding) {
  std::vector<std::byte> buf(8 * 3 + 6);
  buf[8] = std::byte{7};
  sc::Frame f(6, 4, sc::PixelFormat::Grayscale8, 8, std::move(buf));
  ASSERT_TRUE(f.valid());
  const auto r1 = f.row(1);
  ASSERT_EQ(r1.size(), 6u);
  EXPECT_EQ(r1[0], std::byte{7});
}

TEST(Frame, ShortBufferIsInvalid) {
  sc::Frame f(10, 10, sc::PixelFormat::Grayscale8, std::vector<std::byte>(10));
  EXPECT_FALSE(f.empty());
  EXPECT_FALSE(f.valid());
}

TEST(Frame, StrideShorterThanRowIsInvalid) {
  sc::Frame f(10, 2, sc::PixelFormat::RGBA8, 20, std::vector<std::byte>(200));
  EXPECT_FALSE(f.valid());
}

TEST(Frame, UnknownFormatIsInvalid) {
  sc::Frame f(4, 4, sc::PixelFormat::Unknown, std::vector<std::byte>(64));
  EXPECT_FALSE(f.valid());
}

TEST(Frame, BytesPerPixel) {
  EXPECT_EQ(sc::bytes_per_pixel(sc::PixelFormat::Grayscale8), 1u);
  EXPECT_EQ(sc::bytes_per_pixel(sc::PixelFormat::RGB8), 3u);
  EXPECT_EQ(sc::bytes_per_pixel(sc::PixelFormat::BGRA8), 4u);
  EXPECT_EQ(sc::bytes_per_pixel(sc::PixelFormat::Unknown), 0u);
}
