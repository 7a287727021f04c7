#include <fadegif/imaging/sharpen_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace fadegif::imaging {

namespace fc = fadegif::core;

SharpenStage::SharpenStage(float strength, int threshold)
    : strength_(strength), threshold_(threshold) {}

std::expected<fc::Frame, fc::Error> SharpenStage::process(const fc::Frame& input) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "frame has no usable pixel data"});
  }

  if (strength_ <= 0.f) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return fc::Frame(input.width(), input.height(), input.format(), std::move(buf),
                     input.duration_ms());
  }

  cv::Mat blurred;
  cv::GaussianBlur(*mat_in, blurred, cv::Size(0, 0), static_cast<double>(strength_));

  cv::Mat sharpened;
  cv::addWeighted(*mat_in, 1.0 + strength_, blurred, -static_cast<double>(strength_), 0.0,
                  sharpened);

  cv::Mat diff;
  cv::absdiff(*mat_in, blurred, diff);
  cv::Mat mask = diff >= threshold_;

  cv::Mat out = mat_in->clone();
  sharpened.copyTo(out, mask);
  return detail::mat_to_frame(out, input.format(), input.duration_ms());
}

}  // namespace fadegif::imaging
