#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/pipeline_config.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace fadegif::app {

using fadegif::core::PipelineConfig;

/// Defaults of the desktop tool: 1920x1080 canvas, 15 fade steps, 1000 ms hold,
/// 50 ms fade, quality 95, Lanczos, Median Cut, Floyd-Steinberg, per-frame palettes.
PipelineConfig default_config();

/// Apply one key=value setting (same keys as the config file). InvalidConfig
/// for unknown keys or values that do not parse.
[[nodiscard]] std::expected<void, fadegif::core::Error> apply_setting(
    PipelineConfig& config, std::string_view key, std::string_view value);

/// Load config from a simple key=value file (one per line, '#' comments) on top
/// of the defaults. A missing file yields the defaults.
[[nodiscard]] std::expected<PipelineConfig, fadegif::core::Error> load_config(
    const std::string& path);

/// Range checks: sharpen 0-2, fade steps 5-50, hold 100-5000 ms, fade 10-500 ms,
/// quality 50-100, non-empty canvas, non-empty crop.
[[nodiscard]] std::expected<void, fadegif::core::Error> validate_config(
    const PipelineConfig& config);

}  // namespace fadegif::app
