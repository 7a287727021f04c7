#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <fadegif/core/indexed_frame.hpp>
#include <fadegif/core/palette.hpp>
#include <fadegif/core/pipeline_config.hpp>
#include <expected>

namespace fadegif::gif {

/// Reduces BGR8 frames to indexed color (at most 256 entries).
///
/// Palettes come from Median Cut (split the most populated box), Maximum
/// Coverage (split the box spanning the largest color volume) or Fast Octree
/// (depth-5 octree folded from the least populated nodes). A frame with 256 or
/// fewer distinct colors keeps them exactly. Palettes are sorted by (r, g, b).
///
/// Deterministic: the same frame, method and dither always give a
/// byte-identical IndexedFrame. Const methods are safe to call concurrently.
class Quantizer {
 public:
  Quantizer(fadegif::core::QuantizeMethod method, fadegif::core::DitherMethod dither);
  explicit Quantizer(const fadegif::core::PipelineConfig& config);

  /// Adaptive palette for a frame.
  [[nodiscard]] std::expected<fadegif::core::Palette, fadegif::core::Error> build_palette(
      const fadegif::core::Frame& frame) const;

  /// Map frame to indices. With shared_palette the frame is mapped onto that
  /// fixed table (global-palette mode); otherwise a fresh palette is built.
  [[nodiscard]] std::expected<fadegif::core::IndexedFrame, fadegif::core::Error> quantize(
      const fadegif::core::Frame& frame,
      const fadegif::core::Palette* shared_palette = nullptr) const;

  [[nodiscard]] fadegif::core::QuantizeMethod method() const noexcept { return method_; }
  [[nodiscard]] fadegif::core::DitherMethod dither() const noexcept { return dither_; }

 private:
  fadegif::core::QuantizeMethod method_;
  fadegif::core::DitherMethod dither_;
};

}  // namespace fadegif::gif
