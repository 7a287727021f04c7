#pragma once

#include <fadegif/core/crop_region.hpp>
#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <fadegif/core/pipeline_stage.hpp>
#include <expected>

namespace fadegif::imaging {

/// Clips the frame to a region; InvalidCrop when the region does not fit. Never clamps.
class CropStage : public fadegif::core::IFrameStage {
 public:
  explicit CropStage(fadegif::core::CropRegion region);

  [[nodiscard]] std::expected<fadegif::core::Frame, fadegif::core::Error>
  process(const fadegif::core::Frame& input) override;

 private:
  fadegif::core::CropRegion region_;
};

}  // namespace fadegif::imaging
