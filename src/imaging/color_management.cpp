#include <fadegif/imaging/color_management.hpp>
#include <lcms2.h>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>

namespace fadegif::imaging {

namespace fc = fadegif::core;

namespace {

// ICC header: dateTimeNumber at offset 24, 12 bytes.
constexpr std::size_t kIccDateOffset = 24;
constexpr std::size_t kIccDateLen = 12;

struct ProfileCloser {
  void operator()(void* profile) const noexcept { cmsCloseProfile(profile); }
};
using ProfilePtr = std::unique_ptr<void, ProfileCloser>;

struct TransformDeleter {
  void operator()(void* transform) const noexcept { cmsDeleteTransform(transform); }
};
using TransformPtr = std::unique_ptr<void, TransformDeleter>;

}  // namespace

bool convert_to_srgb(fc::Frame& pixels, std::span<const std::byte> icc_profile) {
  if (icc_profile.empty() || pixels.empty()) return false;

  ProfilePtr source(cmsOpenProfileFromMem(icc_profile.data(),
                                          static_cast<cmsUInt32Number>(icc_profile.size())));
  if (!source) return false;
  const cmsColorSpaceSignature space = cmsGetColorSpace(source.get());

  cmsUInt32Number in_type = 0;
  cmsUInt32Number out_type = 0;
  cmsUInt32Number flags = 0;
  fc::PixelFormat out_format = pixels.format();
  switch (pixels.format()) {
    case fc::PixelFormat::Grayscale8:
      if (space != cmsSigGrayData) return false;
      in_type = TYPE_GRAY_8;
      out_type = TYPE_BGR_8;
      out_format = fc::PixelFormat::BGR8;
      break;
    case fc::PixelFormat::BGR8:
      if (space != cmsSigRgbData) return false;
      in_type = out_type = TYPE_BGR_8;
      break;
    case fc::PixelFormat::BGRA8:
      if (space != cmsSigRgbData) return false;
      in_type = out_type = TYPE_BGRA_8;
      flags = cmsFLAGS_COPY_ALPHA;
      break;
    default:
      return false;
  }

  ProfilePtr srgb(cmsCreate_sRGBProfile());
  if (!srgb) return false;
  TransformPtr transform(cmsCreateTransform(source.get(), in_type, srgb.get(), out_type,
                                            INTENT_PERCEPTUAL, flags));
  if (!transform) return false;

  const std::size_t in_row = static_cast<std::size_t>(pixels.width()) *
                             fc::Frame::channels(pixels.format());
  const std::size_t out_row = static_cast<std::size_t>(pixels.width()) *
                              fc::Frame::channels(out_format);
  if (out_format == pixels.format()) {
    auto data = pixels.data();
    for (std::uint32_t y = 0; y < pixels.height(); ++y) {
      std::byte* row = data.data() + y * in_row;
      cmsDoTransform(transform.get(), row, row, pixels.width());
    }
    return true;
  }

  std::vector<std::byte> converted(out_row * pixels.height());
  const auto in = std::as_const(pixels).data();
  for (std::uint32_t y = 0; y < pixels.height(); ++y) {
    cmsDoTransform(transform.get(), in.data() + y * in_row, converted.data() + y * out_row,
                   pixels.width());
  }
  pixels = fc::Frame(pixels.width(), pixels.height(), out_format, std::move(converted),
                     pixels.duration_ms());
  return true;
}

const std::vector<std::byte>& srgb_icc_profile() {
  static const std::vector<std::byte> profile = [] {
    std::vector<std::byte> bytes;
    ProfilePtr srgb(cmsCreate_sRGBProfile());
    cmsUInt32Number len = 0;
    if (!srgb || !cmsSaveProfileToMem(srgb.get(), nullptr, &len) || len == 0) return bytes;
    bytes.resize(len);
    if (!cmsSaveProfileToMem(srgb.get(), bytes.data(), &len)) return std::vector<std::byte>{};
    bytes.resize(len);
    if (bytes.size() >= kIccDateOffset + kIccDateLen) {
      std::fill_n(bytes.begin() + kIccDateOffset, kIccDateLen, std::byte{0});
    }
    return bytes;
  }();
  return profile;
}

}  // namespace fadegif::imaging
