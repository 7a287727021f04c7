#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <fadegif/core/pipeline_stage.hpp>
#include <expected>

namespace fadegif::imaging {

/// Unsharp mask scaled by strength: blur sigma = strength, amount = strength,
/// pixels whose difference to the blur is below the threshold are left alone.
class SharpenStage : public fadegif::core::IFrameStage {
 public:
  explicit SharpenStage(float strength, int threshold = 3);

  [[nodiscard]] std::expected<fadegif::core::Frame, fadegif::core::Error>
  process(const fadegif::core::Frame& input) override;

 private:
  float strength_;
  int threshold_;
};

}  // namespace fadegif::imaging
