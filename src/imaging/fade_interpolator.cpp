#include <fadegif/imaging/fade_interpolator.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace fadegif::imaging {

namespace fc = fadegif::core;

std::uint32_t fade_frame_duration(std::uint32_t index, std::uint32_t steps,
                                  std::uint32_t fade_duration_ms) noexcept {
  if (steps == 0) return 0;
  const std::uint64_t total = fade_duration_ms;
  const std::uint64_t end = total * (index + 1) / steps;
  const std::uint64_t begin = total * index / steps;
  return static_cast<std::uint32_t>(end - begin);
}

std::expected<void, fc::Error> for_each_fade_frame(const fc::Frame& a,
                                                   const fc::Frame& b,
                                                   std::uint32_t steps,
                                                   std::uint32_t fade_duration_ms,
                                                   const FadeFrameSink& sink) {
  if (steps == 0) {
    return std::unexpected(fc::Error{fc::PipelineError::InvalidConfig,
                                     "fade needs at least one step"});
  }
  if (!a.same_shape(b)) {
    return std::unexpected(fc::Error{
        fc::PipelineError::DimensionMismatch,
        "cannot blend " + std::to_string(a.width()) + "x" + std::to_string(a.height()) +
            " with " + std::to_string(b.width()) + "x" + std::to_string(b.height())});
  }

  auto mat_a = detail::frame_to_mat(a);
  auto mat_b = detail::frame_to_mat(b);
  if (!mat_a || !mat_b) {
    return std::unexpected(fc::Error{fc::PipelineError::DimensionMismatch,
                                     "fade endpoints have no usable pixel data"});
  }

  for (std::uint32_t i = 0; i < steps; ++i) {
    const double t = static_cast<double>(i + 1) / static_cast<double>(steps + 1);
    cv::Mat blended;
    cv::addWeighted(*mat_a, 1.0 - t, *mat_b, t, 0.0, blended);
    auto sunk = sink(detail::mat_to_frame(blended, a.format(),
                                          fade_frame_duration(i, steps, fade_duration_ms)));
    if (!sunk) return sunk;
  }
  return {};
}

std::expected<std::vector<fc::Frame>, fc::Error> interpolate(const fc::Frame& a,
                                                             const fc::Frame& b,
                                                             std::uint32_t steps,
                                                             std::uint32_t fade_duration_ms) {
  std::vector<fc::Frame> frames;
  frames.reserve(steps);
  auto done = for_each_fade_frame(a, b, steps, fade_duration_ms,
                                  [&frames](fc::Frame f) -> std::expected<void, fc::Error> {
                                    frames.push_back(std::move(f));
                                    return {};
                                  });
  if (!done) return std::unexpected(std::move(done.error()));
  return frames;
}

}  // namespace fadegif::imaging
