#include <fadegif/imaging/resize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <vector>

namespace fadegif::imaging {

namespace fc = fadegif::core;

namespace {

int interpolation_flag(fc::ResamplingFilter filter) {
  switch (filter) {
    case fc::ResamplingFilter::Bicubic:
      return cv::INTER_CUBIC;
    case fc::ResamplingFilter::Bilinear:
      return cv::INTER_LINEAR;
    case fc::ResamplingFilter::Nearest:
      return cv::INTER_NEAREST;
    case fc::ResamplingFilter::Lanczos:
    default:
      return cv::INTER_LANCZOS4;
  }
}

}  // namespace

std::vector<std::pair<std::uint32_t, std::uint32_t>> plan_resize_passes(
    std::uint32_t src_w, std::uint32_t src_h,
    std::uint32_t dst_w, std::uint32_t dst_h) {
  std::vector<std::pair<std::uint32_t, std::uint32_t>> passes;
  std::uint32_t w = src_w;
  std::uint32_t h = src_h;
  while (w > 2 * dst_w || h > 2 * dst_h) {
    w = std::max(w / 2, dst_w);
    h = std::max(h / 2, dst_h);
    passes.emplace_back(w, h);
  }
  if (passes.empty() || passes.back() != std::make_pair(dst_w, dst_h)) {
    passes.emplace_back(dst_w, dst_h);
  }
  return passes;
}

ResizeStage::ResizeStage(fc::CanvasSize canvas, fc::ResamplingFilter filter,
                         fc::Rgb background)
    : canvas_(canvas), filter_(filter), background_(background) {}

std::expected<fc::Frame, fc::Error> ResizeStage::process(const fc::Frame& input) {
  if (canvas_.width == 0 || canvas_.height == 0) {
    return std::unexpected(fc::Error{fc::PipelineError::InvalidConfig,
                                     "canvas must not be empty"});
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "frame has no usable pixel data"});
  }

  if (input.width() == canvas_.width && input.height() == canvas_.height) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return fc::Frame(input.width(), input.height(), input.format(), std::move(buf),
                     input.duration_ms());
  }

  const double scale = std::min(static_cast<double>(canvas_.width) / input.width(),
                                static_cast<double>(canvas_.height) / input.height());
  const auto fit_w = std::clamp<std::uint32_t>(
      static_cast<std::uint32_t>(input.width() * scale), 1, canvas_.width);
  const auto fit_h = std::clamp<std::uint32_t>(
      static_cast<std::uint32_t>(input.height() * scale), 1, canvas_.height);

  const int flag = interpolation_flag(filter_);
  cv::Mat current = *mat_in;
  for (const auto& [w, h] : plan_resize_passes(input.width(), input.height(), fit_w, fit_h)) {
    cv::Mat next;
    cv::resize(current, next, cv::Size(static_cast<int>(w), static_cast<int>(h)), 0, 0, flag);
    current = next;
  }

  const cv::Scalar fill = input.format() == fc::PixelFormat::Grayscale8
                              ? cv::Scalar(background_.g)
                              : cv::Scalar(background_.b, background_.g, background_.r, 255);
  cv::Mat canvas(static_cast<int>(canvas_.height), static_cast<int>(canvas_.width),
                 mat_in->type(), fill);
  const int x_offset = static_cast<int>((canvas_.width - fit_w) / 2);
  const int y_offset = static_cast<int>((canvas_.height - fit_h) / 2);
  current.copyTo(canvas(cv::Rect(x_offset, y_offset, current.cols, current.rows)));

  return detail::mat_to_frame(canvas, input.format(), input.duration_ms());
}

}  // namespace fadegif::imaging
