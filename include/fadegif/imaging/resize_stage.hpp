#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <fadegif/core/pipeline_config.hpp>
#include <fadegif/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>
#include <utility>
#include <vector>

namespace fadegif::imaging {

/// Intermediate sizes for a downscale from (src_w, src_h) to (dst_w, dst_h).
/// When the source is more than twice the target on either axis, each pass
/// halves the image (never going below the target) before the final pass.
/// The last entry is always (dst_w, dst_h).
[[nodiscard]] std::vector<std::pair<std::uint32_t, std::uint32_t>> plan_resize_passes(
    std::uint32_t src_w, std::uint32_t src_h,
    std::uint32_t dst_w, std::uint32_t dst_h);

/// Fits the frame inside a fixed canvas, keeping aspect ratio; the image is
/// centered and the rest filled with the background color.
class ResizeStage : public fadegif::core::IFrameStage {
 public:
  ResizeStage(fadegif::core::CanvasSize canvas,
              fadegif::core::ResamplingFilter filter,
              fadegif::core::Rgb background);

  [[nodiscard]] std::expected<fadegif::core::Frame, fadegif::core::Error>
  process(const fadegif::core::Frame& input) override;

 private:
  fadegif::core::CanvasSize canvas_;
  fadegif::core::ResamplingFilter filter_;
  fadegif::core::Rgb background_;
};

}  // namespace fadegif::imaging
