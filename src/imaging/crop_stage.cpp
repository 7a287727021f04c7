#include <fadegif/imaging/crop_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace fadegif::imaging {

namespace fc = fadegif::core;

CropStage::CropStage(fc::CropRegion region) : region_(region) {}

std::expected<fc::Frame, fc::Error> CropStage::process(const fc::Frame& input) {
  if (!region_.fits(input.width(), input.height())) {
    return std::unexpected(fc::Error{
        fc::PipelineError::InvalidCrop,
        "crop (" + std::to_string(region_.left) + "," + std::to_string(region_.top) +
            "," + std::to_string(region_.right) + "," + std::to_string(region_.bottom) +
            ") does not fit " + std::to_string(input.width()) + "x" +
            std::to_string(input.height())});
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "frame has no usable pixel data"});
  }

  const cv::Rect roi(static_cast<int>(region_.left), static_cast<int>(region_.top),
                     static_cast<int>(region_.width()), static_cast<int>(region_.height()));
  return detail::mat_to_frame((*mat_in)(roi), input.format(), input.duration_ms());
}

}  // namespace fadegif::imaging
