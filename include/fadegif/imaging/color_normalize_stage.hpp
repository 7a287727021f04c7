#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <fadegif/core/palette.hpp>
#include <fadegif/core/pipeline_stage.hpp>
#include <expected>

namespace fadegif::imaging {

/// Converts any decoded layout to BGR8: grayscale is expanded, alpha is
/// composited over the background color.
class ColorNormalizeStage : public fadegif::core::IFrameStage {
 public:
  explicit ColorNormalizeStage(fadegif::core::Rgb background);

  [[nodiscard]] std::expected<fadegif::core::Frame, fadegif::core::Error>
  process(const fadegif::core::Frame& input) override;

 private:
  fadegif::core::Rgb background_;
};

}  // namespace fadegif::imaging
