#pragma once

#include <fadegif/core/crop_region.hpp>
#include <fadegif/core/palette.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <variant>

namespace fadegif::core {

/// Resampling filter used when fitting images to the canvas.
enum class ResamplingFilter : std::uint8_t {
  Lanczos,
  Bicubic,
  Bilinear,
  Nearest,
};

/// Palette construction algorithm.
enum class QuantizeMethod : std::uint8_t {
  MedianCut,
  MaximumCoverage,
  FastOctree,
};

/// How quantization error is diffused when mapping pixels to the palette.
enum class DitherMethod : std::uint8_t {
  FloydSteinberg,
  Ordered,
  None,
};

/// Each frame gets its own adaptive palette.
struct PerFramePalette {
  bool operator==(const PerFramePalette&) const = default;
};

/// All frames share one palette; built from the first base frame when not supplied.
struct GlobalPalette {
  std::optional<Palette> palette;
  bool operator==(const GlobalPalette&) const = default;
};

using PaletteMode = std::variant<PerFramePalette, GlobalPalette>;

/// Output canvas dimensions in pixels.
struct CanvasSize {
  std::uint32_t width{1920};
  std::uint32_t height{1080};
  bool operator==(const CanvasSize&) const = default;
};

/// Immutable configuration snapshot for one run.
struct PipelineConfig {
  CanvasSize canvas{};
  /// Keep source resolution; the canvas becomes the largest image size (or the crop size).
  bool preserve_original{false};
  ResamplingFilter resampling{ResamplingFilter::Lanczos};
  QuantizeMethod quantize_method{QuantizeMethod::MedianCut};
  DitherMethod dither{DitherMethod::FloydSteinberg};
  PaletteMode palette_mode{PerFramePalette{}};
  float sharpen_strength{0.f};            // 0.0 - 2.0
  std::uint32_t fade_steps{15};           // 5 - 50
  std::uint32_t hold_duration_ms{1000};   // 100 - 5000
  std::uint32_t fade_duration_ms{50};     // 10 - 500
  std::uint32_t jpeg_quality{95};         // 50 - 100, lossy re-encoding only
  bool optimize{true};                    // drop unused palette entries
  std::optional<CropRegion> crop;
  Rgb background{255, 255, 255};          // letterbox padding and alpha flattening
  std::optional<std::filesystem::path> preview_path;
};

}  // namespace fadegif::core
