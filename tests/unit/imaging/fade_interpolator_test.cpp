#include <fadegif/imaging/fade_interpolator.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>

namespace fc = fadegif::core;
namespace fi = fadegif::imaging;
namespace ft = fadegif::testing;

namespace {

int first_byte(const fc::Frame& f) { return std::to_integer<int>(f.data()[0]); }

}  // namespace

TEST(FadeInterpolator, ProducesStepsInteriorFrames) {
  const auto black = ft::solid_frame(8, 8, 0, 0, 0);
  const auto white = ft::solid_frame(8, 8, 255, 255, 255);
  auto frames = fi::interpolate(black, white, 15, 50);
  ASSERT_TRUE(frames.has_value());
  ASSERT_EQ(frames->size(), 15u);

  int last = 0;
  for (const auto& f : *frames) {
    EXPECT_TRUE(f.same_shape(black));
    const int v = first_byte(f);
    EXPECT_GT(v, last);
    EXPECT_LT(v, 255);
    last = v;
  }
}

TEST(FadeInterpolator, BlendWeights) {
  const auto black = ft::solid_frame(2, 2, 0, 0, 0);
  const auto white = ft::solid_frame(2, 2, 200, 200, 200);
  auto frames = fi::interpolate(black, white, 3, 30);
  ASSERT_TRUE(frames.has_value());
  ASSERT_EQ(frames->size(), 3u);
  EXPECT_EQ(first_byte((*frames)[0]), 50);
  EXPECT_EQ(first_byte((*frames)[1]), 100);
  EXPECT_EQ(first_byte((*frames)[2]), 150);
}

TEST(FadeInterpolator, IdenticalEndpointsGiveIdenticalFrames) {
  const auto a = ft::noise_frame(16, 16, 7);
  auto frames = fi::interpolate(a, a, 10, 100);
  ASSERT_TRUE(frames.has_value());
  for (const auto& f : *frames) {
    EXPECT_TRUE(std::equal(a.data().begin(), a.data().end(), f.data().begin()));
  }
}

TEST(FadeInterpolator, DurationsSumToFadeDuration) {
  for (std::uint32_t steps : {5u, 7u, 15u, 50u}) {
    for (std::uint32_t fade : {10u, 50u, 333u, 500u}) {
      std::uint32_t sum = 0;
      for (std::uint32_t i = 0; i < steps; ++i) sum += fi::fade_frame_duration(i, steps, fade);
      EXPECT_EQ(sum, fade) << steps << " steps, " << fade << " ms";
    }
  }
  EXPECT_EQ(fi::fade_frame_duration(0, 10, 200), 20u);
}

TEST(FadeInterpolator, FrameDurationsMatchSplit) {
  const auto a = ft::solid_frame(2, 2, 0, 0, 0);
  auto frames = fi::interpolate(a, a, 15, 50);
  ASSERT_TRUE(frames.has_value());
  std::uint32_t sum = 0;
  for (std::uint32_t i = 0; i < frames->size(); ++i) {
    EXPECT_EQ((*frames)[i].duration_ms(), fi::fade_frame_duration(i, 15, 50));
    sum += (*frames)[i].duration_ms();
  }
  EXPECT_EQ(sum, 50u);
}

TEST(FadeInterpolator, DimensionMismatch) {
  auto frames = fi::interpolate(ft::solid_frame(4, 4, 0, 0, 0), ft::solid_frame(4, 5, 0, 0, 0), 5, 50);
  ASSERT_FALSE(frames.has_value());
  EXPECT_EQ(frames.error().kind, fc::PipelineError::DimensionMismatch);
}

TEST(FadeInterpolator, ZeroStepsIsInvalid) {
  const auto a = ft::solid_frame(2, 2, 0, 0, 0);
  auto frames = fi::interpolate(a, a, 0, 50);
  ASSERT_FALSE(frames.has_value());
  EXPECT_EQ(frames.error().kind, fc::PipelineError::InvalidConfig);
}

TEST(FadeInterpolator, SinkErrorStopsTheWalk) {
  const auto a = ft::solid_frame(2, 2, 0, 0, 0);
  int seen = 0;
  auto done = fi::for_each_fade_frame(a, a, 10, 100,
                                      [&](fc::Frame) -> std::expected<void, fc::Error> {
                                        if (++seen == 3) {
                                          return std::unexpected(
                                              fc::Error{fc::PipelineError::Encoding, "disk full"});
                                        }
                                        return {};
                                      });
  ASSERT_FALSE(done.has_value());
  EXPECT_EQ(done.error().kind, fc::PipelineError::Encoding);
  EXPECT_EQ(seen, 3);
}
