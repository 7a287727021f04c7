#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace fadegif::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Frame instances are independent; sharing one Frame
/// across threads requires external synchronization.

/// Pixel layout / format. Normalized frames are always BGR8.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
  BGRA8,
};

/// Single image or animation frame: dimensions, format, buffer and display duration.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer,
        std::uint32_t duration_ms = 0)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)),
        duration_ms_(duration_ms) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  /// Display time in milliseconds; 0 until the pipeline assigns one.
  [[nodiscard]] std::uint32_t duration_ms() const noexcept { return duration_ms_; }
  void set_duration_ms(std::uint32_t ms) noexcept { duration_ms_ = ms; }

  /// Mutable view of the buffer (owned).
  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when both frames share width, height and format.
  [[nodiscard]] bool same_shape(const Frame& other) const noexcept {
    return width_ == other.width_ && height_ == other.height_ &&
           format_ == other.format_;
  }

  /// Bytes per pixel for the given format (0 for Unknown).
  [[nodiscard]] static std::size_t channels(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
  std::uint32_t duration_ms_{0};
};

}  // namespace fadegif::core
