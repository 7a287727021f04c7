#include <fadegif/core/crop_region.hpp>

namespace fadegif::core {

CropRegion crop_for_preset(AspectPreset preset) noexcept {
  switch (preset) {
    case AspectPreset::Widescreen16x9:
      return {0, 0, 1920, 1080};
    case AspectPreset::Standard4x3:
      return {0, 0, 1440, 1080};
    case AspectPreset::Square1x1:
      return {0, 0, 1080, 1080};
    case AspectPreset::Vertical9x16:
      return {0, 0, 608, 1080};
    case AspectPreset::UltraWide21x9:
      return {0, 0, 2560, 1080};
    default:
      return {0, 0, 1920, 1080};
  }
}

std::optional<AspectPreset> parse_aspect_preset(std::string_view name) noexcept {
  if (name == "16:9") return AspectPreset::Widescreen16x9;
  if (name == "4:3") return AspectPreset::Standard4x3;
  if (name == "1:1") return AspectPreset::Square1x1;
  if (name == "9:16") return AspectPreset::Vertical9x16;
  if (name == "21:9") return AspectPreset::UltraWide21x9;
  return std::nullopt;
}

}  // namespace fadegif::core
