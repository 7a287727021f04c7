#pragma once

#include <fadegif/core/palette.hpp>
#include <cstdint>
#include <vector>

namespace fadegif::core {

/// Frame after palette reduction: one palette index per pixel, row-major.
struct IndexedFrame {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::vector<std::uint8_t> indices;
  Palette palette;
  std::uint32_t duration_ms{0};
  /// True when palette is the run-wide shared table (written once as the global color map).
  bool uses_global_palette{false};
  /// Base image frame: its delay is written exactly instead of joining the fade rounding.
  bool is_hold{false};

  bool operator==(const IndexedFrame&) const = default;
};

}  // namespace fadegif::core
