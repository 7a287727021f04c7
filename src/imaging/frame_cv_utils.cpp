#include "frame_cv_utils.hpp"
#include <fadegif/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace fadegif::imaging::detail {

namespace fc = fadegif::core;

std::optional<cv::Mat> frame_to_mat(const fc::Frame& frame) {
  if (frame.empty()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  if (frame.size_bytes() < fc::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case fc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case fc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case fc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case fc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

fc::Frame mat_to_frame(const cv::Mat& mat, fc::PixelFormat format,
                       std::uint32_t duration_ms) {
  if (mat.empty()) return fc::Frame();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return fc::Frame(w, h, format, std::move(buffer), duration_ms);
}

}  // namespace fadegif::imaging::detail
