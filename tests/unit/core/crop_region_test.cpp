#include <fadegif/core/crop_region.hpp>
#include <gtest/gtest.h>

namespace fc = fadegif::core;

TEST(CropRegion, FitsRequiresNonEmptyInsideBounds) {
  EXPECT_TRUE((fc::CropRegion{0, 0, 100, 50}).fits(100, 50));
  EXPECT_TRUE((fc::CropRegion{10, 5, 20, 15}).fits(100, 50));
  EXPECT_FALSE((fc::CropRegion{10, 0, 10, 50}).fits(100, 50));
  EXPECT_FALSE((fc::CropRegion{20, 0, 10, 50}).fits(100, 50));
  EXPECT_FALSE((fc::CropRegion{0, 0, 101, 50}).fits(100, 50));
  EXPECT_FALSE((fc::CropRegion{0, 0, 100, 51}).fits(100, 50));
}

TEST(CropRegion, Size) {
  const fc::CropRegion r{10, 20, 110, 70};
  EXPECT_EQ(r.width(), 100u);
  EXPECT_EQ(r.height(), 50u);
  EXPECT_EQ((fc::CropRegion{5, 5, 1, 1}).width(), 0u);
}

TEST(AspectPreset, Rectangles) {
  EXPECT_EQ(fc::crop_for_preset(fc::AspectPreset::Widescreen16x9), (fc::CropRegion{0, 0, 1920, 1080}));
  EXPECT_EQ(fc::crop_for_preset(fc::AspectPreset::Standard4x3), (fc::CropRegion{0, 0, 1440, 1080}));
  EXPECT_EQ(fc::crop_for_preset(fc::AspectPreset::Square1x1), (fc::CropRegion{0, 0, 1080, 1080}));
  EXPECT_EQ(fc::crop_for_preset(fc::AspectPreset::Vertical9x16), (fc::CropRegion{0, 0, 608, 1080}));
  EXPECT_EQ(fc::crop_for_preset(fc::AspectPreset::UltraWide21x9), (fc::CropRegion{0, 0, 2560, 1080}));
}

TEST(AspectPreset, Parse) {
  EXPECT_EQ(fc::parse_aspect_preset("4:3"), fc::AspectPreset::Standard4x3);
  EXPECT_EQ(fc::parse_aspect_preset("9:16"), fc::AspectPreset::Vertical9x16);
  EXPECT_FALSE(fc::parse_aspect_preset("3:2").has_value());
}
