#include <fadegif/core/frame.hpp>
#include <cstddef>

namespace fadegif::core {

std::size_t Frame::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                              std::uint32_t height,
                              PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channels(format);
}

}  // namespace fadegif::core
