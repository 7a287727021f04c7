#pragma once

#include <fadegif/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace fadegif::testing {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "fadegif_";
    if (info) name += std::string(info->test_suite_name()) + "_" + info->name();
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
  [[nodiscard]] std::filesystem::path operator/(const std::string& name) const {
    return path_ / name;
  }

 private:
  std::filesystem::path path_;
};

inline core::Frame solid_frame(std::uint32_t w, std::uint32_t h, std::uint8_t b, std::uint8_t g,
                               std::uint8_t r, std::uint32_t duration_ms = 0) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3);
  for (std::size_t i = 0; i < buf.size(); i += 3) {
    buf[i] = std::byte{b};
    buf[i + 1] = std::byte{g};
    buf[i + 2] = std::byte{r};
  }
  return core::Frame(w, h, core::PixelFormat::BGR8, std::move(buf), duration_ms);
}

/// BGR8 frame of uniform random noise (many distinct colors); seeded.
inline core::Frame noise_frame(std::uint32_t w, std::uint32_t h, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3);
  for (auto& v : buf) v = static_cast<std::byte>(dist(rng));
  return core::Frame(w, h, core::PixelFormat::BGR8, std::move(buf));
}

/// Horizontal BGR gradient; distinct colors grow with width.
inline cv::Mat gradient_mat(int w, int h) {
  cv::Mat m(h, w, CV_8UC3);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      m.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 255 / std::max(w - 1, 1)),
                                        static_cast<uchar>(y * 255 / std::max(h - 1, 1)),
                                        static_cast<uchar>(128));
    }
  }
  return m;
}

inline std::filesystem::path write_image(const std::filesystem::path& path, const cv::Mat& mat) {
  EXPECT_TRUE(cv::imwrite(path.string(), mat)) << path;
  return path;
}

inline std::filesystem::path write_solid_png(const std::filesystem::path& path, int w, int h,
                                             cv::Scalar bgr) {
  return write_image(path, cv::Mat(h, w, CV_8UC3, bgr));
}

}  // namespace fadegif::testing
