#include <fadegif/imaging/frame_builder.hpp>
#include <fadegif/imaging/color_normalize_stage.hpp>
#include <fadegif/imaging/crop_stage.hpp>
#include <fadegif/imaging/resize_stage.hpp>
#include <fadegif/imaging/sharpen_stage.hpp>
#include <algorithm>
#include <memory>

namespace fadegif::imaging {

namespace fc = fadegif::core;

std::expected<fc::CanvasSize, fc::Error> resolve_canvas(
    const fc::PipelineConfig& config, std::span<const std::filesystem::path> images) {
  if (!config.preserve_original) return config.canvas;
  if (images.empty()) {
    return std::unexpected(fc::Error{fc::PipelineError::EmptyInput, "no input images"});
  }

  fc::CanvasSize canvas{0, 0};
  for (const auto& path : images) {
    SourceImage image(path);
    if (auto loaded = image.load(); !loaded) {
      return std::unexpected(std::move(loaded.error()));
    }
    const auto& meta = image.metadata();
    if (config.crop && !config.crop->fits(meta.width, meta.height)) {
      return std::unexpected(fc::Error{fc::PipelineError::InvalidCrop,
                                       "crop does not fit " + path.string()});
    }
    canvas.width = std::max(canvas.width, meta.width);
    canvas.height = std::max(canvas.height, meta.height);
  }
  if (config.crop) return fc::CanvasSize{config.crop->width(), config.crop->height()};
  return canvas;
}

FrameBuilder::FrameBuilder(const fc::PipelineConfig& config, fc::CanvasSize canvas)
    : canvas_(canvas), hold_duration_ms_(config.hold_duration_ms) {
  pipeline_.add_stage(std::make_unique<ColorNormalizeStage>(config.background));
  if (config.crop) {
    pipeline_.add_stage(std::make_unique<CropStage>(*config.crop));
  }
  pipeline_.add_stage(
      std::make_unique<ResizeStage>(canvas, config.resampling, config.background));
  if (config.sharpen_strength > 0.f) {
    pipeline_.add_stage(std::make_unique<SharpenStage>(config.sharpen_strength));
  }
}

std::expected<fc::Frame, fc::Error> FrameBuilder::build(SourceImage& image) {
  if (auto loaded = image.load(); !loaded) {
    return std::unexpected(std::move(loaded.error()));
  }

  auto frame = pipeline_.run(image.pixels());
  if (!frame) {
    if (frame.error().kind == fc::PipelineError::InvalidCrop) {
      frame.error().message += " in " + image.path().string();
    }
    return frame;
  }
  frame->set_duration_ms(hold_duration_ms_);
  return frame;
}

}  // namespace fadegif::imaging
