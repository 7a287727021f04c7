#pragma once

#include <fadegif/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace fadegif::imaging::detail {

/// Convert Frame to cv::Mat (shared view, no copy). Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_mat(const fadegif::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
fadegif::core::Frame mat_to_frame(const cv::Mat& mat,
                                  fadegif::core::PixelFormat format,
                                  std::uint32_t duration_ms = 0);

}  // namespace fadegif::imaging::detail
