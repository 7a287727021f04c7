#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

namespace fadegif::imaging {

/// Color space of the file a source was decoded from. Loaded pixels are sRGB
/// in every case.
enum class ColorProfile : std::uint8_t {
  AssumedSrgb,  // no profile embedded
  Embedded,     // icc_profile holds the raw profile; pixels were converted from it
  Unusable,     // icc_profile could not be applied; pixels taken as sRGB
};

struct ImageMetadata {
  std::uint32_t width{0};
  std::uint32_t height{0};
  bool has_alpha{false};
  ColorProfile profile{ColorProfile::AssumedSrgb};
  std::vector<std::byte> icc_profile;
};

/// A source file with lazily-loaded pixels. Pixels are kept in the decoded
/// layout (Grayscale8, BGR8 or BGRA8); normalization is the frame builder's job.
/// GIF files are decoded with giflib (first frame, transparency as alpha),
/// everything else with OpenCV.
/// Owned by the run that loads it; not thread-safe.
class SourceImage {
 public:
  explicit SourceImage(std::filesystem::path path);

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  /// Decode the file once; later calls are no-ops. UnsupportedFormat on failure.
  [[nodiscard]] std::expected<void, fadegif::core::Error> load();

  [[nodiscard]] bool is_loaded() const noexcept { return !pixels_.empty(); }

  /// Decoded pixels; empty before load() and after release().
  [[nodiscard]] const fadegif::core::Frame& pixels() const noexcept { return pixels_; }

  [[nodiscard]] const ImageMetadata& metadata() const noexcept { return metadata_; }

  /// Drop the pixel buffer; metadata is kept.
  void release() noexcept;

 private:
  std::filesystem::path path_;
  fadegif::core::Frame pixels_;
  ImageMetadata metadata_;
};

}  // namespace fadegif::imaging
