#include <fadegif/core/palette.hpp>
#include <limits>

namespace fadegif::core {

std::uint8_t Palette::nearest(Rgb color) const noexcept {
  std::size_t best = 0;
  int best_distance = std::numeric_limits<int>::max();
  for (std::size_t i = 0; i < colors.size(); ++i) {
    const int dr = static_cast<int>(colors[i].r) - color.r;
    const int dg = static_cast<int>(colors[i].g) - color.g;
    const int db = static_cast<int>(colors[i].b) - color.b;
    const int d = dr * dr + dg * dg + db * db;
    if (d < best_distance) {
      best_distance = d;
      best = i;
      if (d == 0) break;
    }
  }
  return static_cast<std::uint8_t>(best);
}

}  // namespace fadegif::core
