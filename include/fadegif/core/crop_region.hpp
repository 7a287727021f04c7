#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fadegif::core {

/// Crop rectangle in source pixel coordinates; right/bottom are exclusive.
struct CropRegion {
  std::uint32_t left{0};
  std::uint32_t top{0};
  std::uint32_t right{0};
  std::uint32_t bottom{0};

  [[nodiscard]] std::uint32_t width() const noexcept {
    return right > left ? right - left : 0;
  }
  [[nodiscard]] std::uint32_t height() const noexcept {
    return bottom > top ? bottom - top : 0;
  }

  /// 0 <= left < right <= image_width and 0 <= top < bottom <= image_height.
  [[nodiscard]] bool fits(std::uint32_t image_width,
                          std::uint32_t image_height) const noexcept {
    return left < right && right <= image_width && top < bottom &&
           bottom <= image_height;
  }

  bool operator==(const CropRegion&) const = default;
};

/// Fixed aspect-ratio crop presets offered next to the manual rectangle.
enum class AspectPreset : std::uint8_t {
  Widescreen16x9,
  Standard4x3,
  Square1x1,
  Vertical9x16,
  UltraWide21x9,
};

/// Rectangle anchored at the origin with 1080 px height for the preset.
[[nodiscard]] CropRegion crop_for_preset(AspectPreset preset) noexcept;

/// Parse "16:9", "4:3", "1:1", "9:16" or "21:9".
[[nodiscard]] std::optional<AspectPreset> parse_aspect_preset(std::string_view name) noexcept;

}  // namespace fadegif::core
