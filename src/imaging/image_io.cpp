#include <fadegif/imaging/image_io.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <string>
#include <string_view>

namespace fadegif::imaging {

namespace fc = fadegif::core;

bool is_supported_extension(const std::filesystem::path& path) {
  static constexpr std::array<std::string_view, 7> kExtensions = {
      ".png", ".jpg", ".jpeg", ".bmp", ".gif", ".tif", ".tiff"};
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end();
}

std::expected<std::vector<std::byte>, fc::Error> read_file_bytes(
    const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "cannot open " + path.string()});
  }
  const std::streamsize size = f.tellg();
  f.seekg(0, std::ios::beg);
  std::vector<std::byte> bytes(static_cast<std::size_t>(std::max<std::streamsize>(size, 0)));
  if (size > 0 && !f.read(reinterpret_cast<char*>(bytes.data()), size)) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "cannot read " + path.string()});
  }
  return bytes;
}

std::expected<void, fc::Error> write_jpeg(const fc::Frame& frame,
                                          const std::filesystem::path& path,
                                          std::uint32_t quality) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "frame cannot be encoded as JPEG"});
  }
  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY,
                                   static_cast<int>(std::min<std::uint32_t>(quality, 100))};
  bool ok = false;
  try {
    ok = cv::imwrite(path.string(), *mat, params);
  } catch (const cv::Exception& e) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding, e.what()});
  }
  if (!ok) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "cannot write " + path.string()});
  }
  return {};
}

}  // namespace fadegif::imaging
