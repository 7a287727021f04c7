#include <fadegif/imaging/source_image.hpp>
#include "frame_cv_utils.hpp"
#include <fadegif/imaging/color_management.hpp>
#include <fadegif/imaging/icc_profile.hpp>
#include <fadegif/imaging/image_io.hpp>
#include <gif_lib.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace fadegif::imaging {

namespace fc = fadegif::core;

namespace {

constexpr char kGifMagic[] = "GIF8";

bool is_gif(std::span<const std::byte> bytes) {
  return bytes.size() >= 6 && std::memcmp(bytes.data(), kGifMagic, 4) == 0;
}

struct MemoryReader {
  std::span<const std::byte> data;
  std::size_t pos{0};
};

int read_memory(GifFileType* gif, GifByteType* out, int len) {
  auto* reader = static_cast<MemoryReader*>(gif->UserData);
  const std::size_t n =
      std::min(static_cast<std::size_t>(len), reader->data.size() - reader->pos);
  std::memcpy(out, reader->data.data() + reader->pos, n);
  reader->pos += n;
  return static_cast<int>(n);
}

struct GifCloser {
  void operator()(GifFileType* gif) const noexcept {
    int error = 0;
    DGifCloseFile(gif, &error);
  }
};

/// First image of a GIF composed onto its logical screen. BGRA8 when the
/// image declares a transparent index (uncovered and transparent pixels get
/// alpha 0), otherwise BGR8 over the screen's background color.
std::expected<fc::Frame, fc::Error> decode_gif(std::span<const std::byte> bytes,
                                               const std::filesystem::path& path) {
  const auto failed = [&](int code) {
    const char* text = GifErrorString(code);
    return std::unexpected(fc::Error{
        fc::PipelineError::UnsupportedFormat,
        "cannot decode " + path.string() + ": " +
            (text ? text : "giflib error " + std::to_string(code))});
  };

  MemoryReader reader{bytes};
  int error = 0;
  std::unique_ptr<GifFileType, GifCloser> gif(DGifOpen(&reader, read_memory, &error));
  if (!gif) return failed(error);
  if (DGifSlurp(gif.get()) != GIF_OK) return failed(gif->Error);
  if (gif->ImageCount < 1 || gif->SWidth <= 0 || gif->SHeight <= 0) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "no image in " + path.string()});
  }

  const SavedImage& image = gif->SavedImages[0];
  const ColorMapObject* map =
      image.ImageDesc.ColorMap ? image.ImageDesc.ColorMap : gif->SColorMap;
  if (!map) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "no color table in " + path.string()});
  }

  GraphicsControlBlock gcb{};
  gcb.TransparentColor = NO_TRANSPARENT_COLOR;
  DGifSavedExtensionToGCB(gif.get(), 0, &gcb);  // leaves gcb as is without a GCB
  const bool alpha = gcb.TransparentColor != NO_TRANSPARENT_COLOR;

  const auto width = static_cast<std::uint32_t>(gif->SWidth);
  const auto height = static_cast<std::uint32_t>(gif->SHeight);
  const std::size_t channels = alpha ? 4 : 3;
  std::vector<std::byte> buffer(static_cast<std::size_t>(width) * height * channels);
  if (!alpha && gif->SColorMap && gif->SBackGroundColor < gif->SColorMap->ColorCount) {
    const GifColorType bg = gif->SColorMap->Colors[gif->SBackGroundColor];
    for (std::size_t i = 0; i < buffer.size(); i += 3) {
      buffer[i] = std::byte{bg.Blue};
      buffer[i + 1] = std::byte{bg.Green};
      buffer[i + 2] = std::byte{bg.Red};
    }
  }

  const GifImageDesc& desc = image.ImageDesc;
  for (int y = 0; y < desc.Height; ++y) {
    const int cy = desc.Top + y;
    if (cy < 0 || cy >= gif->SHeight) continue;
    for (int x = 0; x < desc.Width; ++x) {
      const int cx = desc.Left + x;
      if (cx < 0 || cx >= gif->SWidth) continue;
      const int index = image.RasterBits[static_cast<std::size_t>(y) * desc.Width + x];
      if ((alpha && index == gcb.TransparentColor) || index >= map->ColorCount) continue;
      const GifColorType c = map->Colors[index];
      std::byte* out =
          buffer.data() + (static_cast<std::size_t>(cy) * width + cx) * channels;
      out[0] = std::byte{c.Blue};
      out[1] = std::byte{c.Green};
      out[2] = std::byte{c.Red};
      if (alpha) out[3] = std::byte{255};
    }
  }
  return fc::Frame(width, height, alpha ? fc::PixelFormat::BGRA8 : fc::PixelFormat::BGR8,
                   std::move(buffer));
}

std::expected<fc::Frame, fc::Error> decode_with_opencv(std::span<std::byte> bytes,
                                                       const std::filesystem::path& path) {
  cv::Mat mat;
  try {
    const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, bytes.data());
    mat = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     path.string() + ": " + e.what()});
  }
  if (mat.empty()) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "cannot decode " + path.string()});
  }

  if (mat.depth() == CV_16U) {
    mat.convertTo(mat, CV_8U, 1.0 / 257.0);
  } else if (mat.depth() != CV_8U) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "unsupported sample depth: " + path.string()});
  }

  fc::PixelFormat format = fc::PixelFormat::Unknown;
  switch (mat.channels()) {
    case 1: format = fc::PixelFormat::Grayscale8; break;
    case 3: format = fc::PixelFormat::BGR8; break;
    case 4: format = fc::PixelFormat::BGRA8; break;
    default:
      return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                       "unsupported channel layout: " + path.string()});
  }
  return detail::mat_to_frame(mat, format);
}

}  // namespace

SourceImage::SourceImage(std::filesystem::path path) : path_(std::move(path)) {}

std::expected<void, fc::Error> SourceImage::load() {
  if (is_loaded()) return {};

  if (!is_supported_extension(path_)) {
    return std::unexpected(fc::Error{fc::PipelineError::UnsupportedFormat,
                                     "unsupported image type: " + path_.string()});
  }

  auto bytes = read_file_bytes(path_);
  if (!bytes) return std::unexpected(std::move(bytes.error()));

  auto decoded = is_gif(*bytes) ? decode_gif(*bytes, path_) : decode_with_opencv(*bytes, path_);
  if (!decoded) return std::unexpected(std::move(decoded.error()));

  metadata_.width = decoded->width();
  metadata_.height = decoded->height();
  metadata_.has_alpha = decoded->format() == fc::PixelFormat::BGRA8;
  metadata_.icc_profile = extract_icc_profile(*bytes);
  if (metadata_.icc_profile.empty()) {
    metadata_.profile = ColorProfile::AssumedSrgb;
  } else {
    metadata_.profile = convert_to_srgb(*decoded, metadata_.icc_profile)
                            ? ColorProfile::Embedded
                            : ColorProfile::Unusable;
  }
  pixels_ = std::move(*decoded);
  return {};
}

void SourceImage::release() noexcept { pixels_ = fc::Frame(); }

}  // namespace fadegif::imaging
