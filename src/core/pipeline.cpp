#include <fadegif/core/pipeline.hpp>
#include <chrono>

namespace fadegif::core {

void FramePipeline::add_stage(std::unique_ptr<IFrameStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<Frame, Error> FramePipeline::run(
    const Frame& input,
    StageTimingCallback* timing_cb) {
  if (stages_.empty()) {
    return std::unexpected(
        Error{PipelineError::InvalidConfig, "frame pipeline has no stages"});
  }

  const Frame* current = &input;
  Frame staged;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*current);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(std::move(result.error()));
    }

    staged = std::move(*result);
    current = &staged;
  }

  return staged;
}

}  // namespace fadegif::core
