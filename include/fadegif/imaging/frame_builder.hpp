#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <fadegif/core/pipeline.hpp>
#include <fadegif/core/pipeline_config.hpp>
#include <fadegif/imaging/source_image.hpp>
#include <expected>
#include <filesystem>
#include <span>

namespace fadegif::imaging {

/// Canvas for a run: the configured size, or with preserve_original the
/// largest width and largest height over all images (after cropping, so the
/// crop size). In preserve mode every image is decoded once and released.
[[nodiscard]] std::expected<fadegif::core::CanvasSize, fadegif::core::Error>
resolve_canvas(const fadegif::core::PipelineConfig& config,
               std::span<const std::filesystem::path> images);

/// Turns a SourceImage into a normalized BGR8 base frame on the run's canvas:
/// color normalize -> crop (optional) -> fit to canvas -> sharpen (optional).
/// The frame's duration is the configured hold duration.
class FrameBuilder {
 public:
  FrameBuilder(const fadegif::core::PipelineConfig& config,
               fadegif::core::CanvasSize canvas);

  /// Loads the image when needed; the image's pixels are not modified.
  [[nodiscard]] std::expected<fadegif::core::Frame, fadegif::core::Error> build(
      SourceImage& image);

  [[nodiscard]] fadegif::core::CanvasSize canvas() const noexcept { return canvas_; }

 private:
  fadegif::core::CanvasSize canvas_;
  std::uint32_t hold_duration_ms_;
  fadegif::core::FramePipeline pipeline_;
};

}  // namespace fadegif::imaging
