#include <covermock/core/frame.hpp>
#include <covermock/core/quad.hpp>
#include <covermock/vision/mask_composite_stage.hpp>
#include <covermock/vision/quad_warp_stage.hpp>
#include <covermock/vision/smooth_stage.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace cc = covermock::core;
namespace vis = covermock::vision;

TEST(SmoothStage, KeepsDimensionsAndFormat) {
  const std::array<std::uint8_t, 4> px{10, 20, 30, 255};
  const auto in = cc::Frame::filled(37, 21, cc::PixelFormat::RGBA8, px);
  vis::SmoothStage stage;
  auto out = stage.process(in);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 37u);
  EXPECT_EQ(out->height(), 21u);
  EXPECT_EQ(out->format(), cc::PixelFormat::RGBA8);
}

TEST(SmoothStage, UniformImageUnchanged) {
  const std::array<std::uint8_t, 4> px{70, 130, 180, 255};
  const auto in = cc::Frame::filled(24, 24, cc::PixelFormat::RGBA8, px);
  auto out = vis::SmoothStage{}.process(in);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(std::equal(in.data().begin(), in.data().end(), out->data().begin()));
}

TEST(SmoothStage, SoftensHardEdge) {
  // Alternating 0/255 columns: a resample round trip must pull values off the extremes.
  const std::uint32_t w = 16;
  const std::uint32_t h = 8;
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      buf[static_cast<std::size_t>(y) * w + x] = std::byte{x % 2 == 0 ? std::uint8_t{0} : std::uint8_t{255}};
    }
  }
  const cc::Frame in(w, h, cc::PixelFormat::Grayscale8, std::move(buf));
  auto out = vis::SmoothStage{vis::Interpolation::Linear}.process(in);
  ASSERT_TRUE(out.has_value());
  bool changed = false;
  for (std::size_t i = 0; i < out->size_bytes(); ++i) {
    if (out->data()[i] != in.data()[i]) changed = true;
  }
  EXPECT_TRUE(changed);
}

namespace {

cc::Frame warped_white_cover() {
  const std::array<std::uint8_t, 3> white{255, 255, 255};
  const auto cover = cc::Frame::filled(40, 60, cc::PixelFormat::RGB8, white);
  const cc::QuadRegion quad{{20, 20}, {60, 14}, {60, 70}, {20, 64}};
  auto warped = vis::warp_into_quad(cover, quad, 80, 90, vis::WarpOptions{});
  return warped ? std::move(*warped) : cc::Frame{};
}

}  // namespace

TEST(SmoothStage, TransparentSurroundDoesNotDarkenEdge) {
  const cc::Frame warped = warped_white_cover();
  ASSERT_TRUE(warped.valid());
  auto smoothed = vis::SmoothStage{}.process(warped);
  ASSERT_TRUE(smoothed.has_value());

  std::size_t partial = 0;
  const auto px = smoothed->data();
  for (std::size_t i = 0; i + 3 < px.size(); i += 4) {
    const int alpha = std::to_integer<int>(px[i + 3]);
    if (alpha == 0) continue;
    if (alpha < 255) ++partial;
    for (std::size_t c = 0; c < 3; ++c) {
      ASSERT_GE(std::to_integer<int>(px[i + c]), 254) << "pixel " << i / 4 << " alpha " << alpha;
    }
  }
  EXPECT_GT(partial, 0u);
}

TEST(SmoothStage, CompositedEdgeNeverDarkerThanTemplate) {
  auto smoothed = vis::SmoothStage{}.process(warped_white_cover());
  ASSERT_TRUE(smoothed.has_value());
  const std::array<std::uint8_t, 4> grey{240, 240, 240, 255};
  const auto base = cc::Frame::filled(80, 90, cc::PixelFormat::RGBA8, grey);
  const std::array<std::uint8_t, 1> on{255};
  const auto mask = cc::Frame::filled(80, 90, cc::PixelFormat::Grayscale8, on);

  auto out = vis::composite_through_mask(base, *smoothed, mask);
  ASSERT_TRUE(out.has_value());
  for (const std::byte b : out->data()) {
    ASSERT_GE(std::to_integer<int>(b), 240);
  }
}

TEST(SmoothStage, InvalidInputRejected) {
  auto out = vis::SmoothStage{}.process(cc::Frame{});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), cc::PipelineError::InvalidImage);
}
