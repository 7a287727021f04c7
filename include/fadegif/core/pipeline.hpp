#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <fadegif/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace fadegif::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of frame stages; each stage's output feeds the next.
class FramePipeline {
 public:
  FramePipeline() = default;

  void add_stage(std::unique_ptr<IFrameStage> stage);

  /// Run all stages on one frame; returns the last stage's Frame or the first error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// An empty pipeline is a configuration error.
  [[nodiscard]] std::expected<Frame, Error> run(
      const Frame& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IFrameStage>> stages_;
};

}  // namespace fadegif::core
