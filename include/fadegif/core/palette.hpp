#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fadegif::core {

/// 8-bit RGB color.
struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  auto operator<=>(const Rgb&) const = default;
};

/// Maximum entries in a GIF color table.
inline constexpr std::size_t kMaxPaletteSize = 256;

/// Color table of at most kMaxPaletteSize entries.
struct Palette {
  std::vector<Rgb> colors;

  [[nodiscard]] std::size_t size() const noexcept { return colors.size(); }
  [[nodiscard]] bool empty() const noexcept { return colors.empty(); }

  /// Index of the closest entry by squared RGB distance; lowest index wins ties.
  /// Palette must not be empty.
  [[nodiscard]] std::uint8_t nearest(Rgb color) const noexcept;

  bool operator==(const Palette&) const = default;
};

}  // namespace fadegif::core
