#include <fadegif/imaging/color_normalize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace fadegif::imaging {

namespace fc = fadegif::core;

ColorNormalizeStage::ColorNormalizeStage(fc::Rgb background)
    : background_(background) {}

std::expected<fc::Frame, fc::Error> ColorNormalizeStage::process(
    const fc::Frame& input) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "frame has no usable pixel data"});
  }

  switch (input.format()) {
    case fc::PixelFormat::BGR8: {
      std::vector<std::byte> buf(input.data().begin(), input.data().end());
      return fc::Frame(input.width(), input.height(), fc::PixelFormat::BGR8,
                       std::move(buf), input.duration_ms());
    }
    case fc::PixelFormat::Grayscale8: {
      cv::Mat mat_out;
      cv::cvtColor(*mat_in, mat_out, cv::COLOR_GRAY2BGR);
      return detail::mat_to_frame(mat_out, fc::PixelFormat::BGR8, input.duration_ms());
    }
    case fc::PixelFormat::BGRA8: {
      cv::Mat color;
      cv::Mat alpha;
      cv::cvtColor(*mat_in, color, cv::COLOR_BGRA2BGR);
      cv::extractChannel(*mat_in, alpha, 3);

      cv::Mat color_f;
      cv::Mat alpha_f;
      color.convertTo(color_f, CV_32FC3);
      alpha.convertTo(alpha_f, CV_32FC1, 1.0 / 255.0);
      cv::Mat alpha3;
      cv::cvtColor(alpha_f, alpha3, cv::COLOR_GRAY2BGR);

      const cv::Mat bg(color.size(), CV_32FC3,
                       cv::Scalar(background_.b, background_.g, background_.r));
      cv::Mat inv_alpha3 = cv::Scalar::all(1.0) - alpha3;
      cv::Mat blended = color_f.mul(alpha3) + bg.mul(inv_alpha3);

      cv::Mat mat_out;
      blended.convertTo(mat_out, CV_8UC3);
      return detail::mat_to_frame(mat_out, fc::PixelFormat::BGR8, input.duration_ms());
    }
    case fc::PixelFormat::Unknown:
    default:
      return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                       "unknown pixel format"});
  }
}

}  // namespace fadegif::imaging
