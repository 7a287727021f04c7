#include <fadegif/gif/gif_writer.hpp>
#include <fadegif/imaging/color_management.hpp>
#include <fadegif/imaging/icc_profile.hpp>
#include <fadegif/imaging/image_io.hpp>
#include <fadegif/imaging/source_image.hpp>
#include "icc_fixtures.hpp"
#include "test_support.hpp"
#include <gif_lib.h>
#include <gtest/gtest.h>
#include <zlib.h>
#include <array>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

namespace fc = fadegif::core;
namespace fi = fadegif::imaging;
namespace ft = fadegif::testing;

namespace {

std::vector<std::byte> to_bytes(const std::string& s) {
  std::vector<std::byte> out(s.size());
  std::memcpy(out.data(), s.data(), s.size());
  return out;
}

/// APP2 ICC_PROFILE segment carrying part seq of count.
std::vector<std::uint8_t> icc_segment(const std::string& body, std::uint8_t seq, std::uint8_t count) {
  std::vector<std::uint8_t> seg = {0xFF, 0xE2};
  const std::size_t len = 2 + 12 + 2 + body.size();
  seg.push_back(static_cast<std::uint8_t>(len >> 8));
  seg.push_back(static_cast<std::uint8_t>(len & 0xFF));
  const char marker[] = "ICC_PROFILE";
  seg.insert(seg.end(), marker, marker + sizeof(marker));  // includes NUL
  seg.push_back(seq);
  seg.push_back(count);
  seg.insert(seg.end(), body.begin(), body.end());
  return seg;
}

/// JPEG of a small image with the given segments inserted after SOI.
std::vector<std::uint8_t> jpeg_with(const std::vector<std::vector<std::uint8_t>>& segments) {
  std::vector<std::uint8_t> encoded;
  EXPECT_TRUE(cv::imencode(".jpg", ft::gradient_mat(16, 16), encoded));
  std::vector<std::uint8_t> out(encoded.begin(), encoded.begin() + 2);
  for (const auto& s : segments) out.insert(out.end(), s.begin(), s.end());
  out.insert(out.end(), encoded.begin() + 2, encoded.end());
  return out;
}

void write_raw(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
  std::ofstream f(path, std::ios::binary);
  f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

void put_be32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

void put_chunk(std::vector<std::uint8_t>& out, const char* type, const std::vector<std::uint8_t>& data) {
  put_be32(out, static_cast<std::uint32_t>(data.size()));
  const std::size_t type_at = out.size();
  out.insert(out.end(), type, type + 4);
  out.insert(out.end(), data.begin(), data.end());
  const uLong crc = crc32(0L, out.data() + type_at, static_cast<uInt>(4 + data.size()));
  put_be32(out, static_cast<std::uint32_t>(crc));
}

/// Byte c of pixel (x, y).
int px(const fc::Frame& f, std::uint32_t x, std::uint32_t y, std::size_t c) {
  const std::size_t channels = fc::Frame::channels(f.format());
  return std::to_integer<int>(f.data()[(static_cast<std::size_t>(y) * f.width() + x) * channels + c]);
}

/// 4x2 screen over a red/blue/green/black global table. The first image is
/// 2x2 at (1, 0), left column green, right column transparent (index 1).
/// A second full-screen black image follows.
void write_transparent_gif(const std::filesystem::path& path) {
  int error = 0;
  GifFileType* gif = EGifOpenFileName(path.string().c_str(), false, &error);
  ASSERT_NE(gif, nullptr);
  EGifSetGifVersion(gif, true);
  const std::array<GifColorType, 4> colors = {
      GifColorType{255, 0, 0}, GifColorType{0, 0, 255}, GifColorType{0, 255, 0},
      GifColorType{0, 0, 0}};
  ColorMapObject* map = GifMakeMapObject(4, colors.data());
  ASSERT_NE(map, nullptr);
  ASSERT_EQ(EGifPutScreenDesc(gif, 4, 2, 8, 0, map), GIF_OK);

  auto put_frame = [&](int left, int width, std::vector<GifPixelType> pixels, int transparent) {
    GraphicsControlBlock gcb{};
    gcb.DisposalMode = DISPOSE_DO_NOT;
    gcb.TransparentColor = transparent;
    std::array<GifByteType, 4> ext{};
    const std::size_t len = EGifGCBToExtension(&gcb, ext.data());
    ASSERT_EQ(EGifPutExtension(gif, GRAPHICS_EXT_FUNC_CODE, static_cast<int>(len), ext.data()),
              GIF_OK);
    ASSERT_EQ(EGifPutImageDesc(gif, left, 0, width, 2, false, nullptr), GIF_OK);
    for (int y = 0; y < 2; ++y) {
      ASSERT_EQ(EGifPutLine(gif, pixels.data() + y * width, width), GIF_OK);
    }
  };
  put_frame(1, 2, {2, 1, 2, 1}, 1);
  put_frame(0, 4, std::vector<GifPixelType>(8, 3), NO_TRANSPARENT_COLOR);

  GifFreeMapObject(map);
  ASSERT_EQ(EGifCloseFile(gif, &error), GIF_OK);
}

}  // namespace

TEST(SourceImage, LoadsLazilyAndReleases) {
  ft::TempDir dir;
  auto path = ft::write_solid_png(dir / "a.png", 12, 8, cv::Scalar(1, 2, 3));
  fi::SourceImage image(path);
  EXPECT_FALSE(image.is_loaded());
  ASSERT_TRUE(image.load().has_value());
  EXPECT_TRUE(image.is_loaded());
  EXPECT_EQ(image.pixels().width(), 12u);
  EXPECT_EQ(image.pixels().height(), 8u);
  EXPECT_EQ(image.pixels().format(), fc::PixelFormat::BGR8);
  EXPECT_EQ(image.metadata().profile, fi::ColorProfile::AssumedSrgb);
  EXPECT_TRUE(image.metadata().icc_profile.empty());

  image.release();
  EXPECT_FALSE(image.is_loaded());
  EXPECT_EQ(image.metadata().width, 12u);
  ASSERT_TRUE(image.load().has_value());
  EXPECT_TRUE(image.is_loaded());
}

TEST(SourceImage, UnparsableIccProfileIsKeptButNotApplied) {
  ft::TempDir dir;
  const std::string body = "fake-icc-profile-bytes";
  const auto path = dir / "tagged.jpg";
  write_raw(path, jpeg_with({icc_segment(body, 1, 1)}));

  fi::SourceImage image(path);
  ASSERT_TRUE(image.load().has_value());
  EXPECT_EQ(image.metadata().profile, fi::ColorProfile::Unusable);
  EXPECT_EQ(image.metadata().icc_profile, to_bytes(body));
  EXPECT_EQ(image.pixels().format(), fc::PixelFormat::BGR8);
}

TEST(SourceImage, EmbeddedProfileIsConvertedToSrgb) {
  ft::TempDir dir;
  const cv::Mat gray(8, 8, CV_8UC3, cv::Scalar(128, 128, 128));
  const auto linear = ft::write_tagged_jpeg(dir / "linear.jpg", gray, ft::linear_rgb_profile());
  const auto srgb = ft::write_tagged_jpeg(dir / "srgb.jpg", gray, ft::srgb_profile());

  fi::SourceImage a(linear);
  ASSERT_TRUE(a.load().has_value());
  EXPECT_EQ(a.metadata().profile, fi::ColorProfile::Embedded);
  for (std::size_t c = 0; c < 3; ++c) EXPECT_NEAR(px(a.pixels(), 4, 4, c), 188, 5);

  fi::SourceImage b(srgb);
  ASSERT_TRUE(b.load().has_value());
  EXPECT_EQ(b.metadata().profile, fi::ColorProfile::Embedded);
  for (std::size_t c = 0; c < 3; ++c) EXPECT_NEAR(px(b.pixels(), 4, 4, c), 128, 3);
}

TEST(SourceImage, GrayProfileYieldsBgrPixels) {
  ft::TempDir dir;
  const auto path = ft::write_tagged_jpeg(dir / "gray.jpg", cv::Mat(6, 6, CV_8UC1, cv::Scalar(128)),
                                          ft::linear_gray_profile());
  fi::SourceImage image(path);
  ASSERT_TRUE(image.load().has_value());
  EXPECT_EQ(image.metadata().profile, fi::ColorProfile::Embedded);
  ASSERT_EQ(image.pixels().format(), fc::PixelFormat::BGR8);
  EXPECT_NEAR(px(image.pixels(), 2, 2, 0), 188, 5);
  EXPECT_EQ(px(image.pixels(), 2, 2, 0), px(image.pixels(), 2, 2, 2));
}

TEST(SourceImage, RgbProfileOnGrayPixelsIsUnusable) {
  ft::TempDir dir;
  const auto path = ft::write_tagged_jpeg(dir / "mismatch.jpg",
                                          cv::Mat(6, 6, CV_8UC1, cv::Scalar(128)),
                                          ft::linear_rgb_profile());
  fi::SourceImage image(path);
  ASSERT_TRUE(image.load().has_value());
  EXPECT_EQ(image.metadata().profile, fi::ColorProfile::Unusable);
  EXPECT_EQ(image.pixels().format(), fc::PixelFormat::Grayscale8);
}

TEST(SourceImage, DecodesGifFirstFrame) {
  ft::TempDir dir;
  const auto path = dir / "blue.gif";
  {
    fadegif::gif::GifWriter writer;
    ASSERT_TRUE(writer.open(path, 6, 4).has_value());
    fc::IndexedFrame frame;
    frame.width = 6;
    frame.height = 4;
    frame.indices.assign(24, 1);
    frame.palette = fc::Palette{{{255, 0, 0}, {0, 0, 255}}};
    frame.duration_ms = 100;
    ASSERT_TRUE(writer.write(frame).has_value());
    frame.indices.assign(24, 0);
    ASSERT_TRUE(writer.write(frame).has_value());
    ASSERT_TRUE(writer.finish().has_value());
  }

  fi::SourceImage image(path);
  auto loaded = image.load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  EXPECT_EQ(image.metadata().width, 6u);
  EXPECT_EQ(image.metadata().height, 4u);
  EXPECT_FALSE(image.metadata().has_alpha);
  ASSERT_EQ(image.pixels().format(), fc::PixelFormat::BGR8);
  EXPECT_EQ(px(image.pixels(), 5, 3, 0), 255);
  EXPECT_EQ(px(image.pixels(), 5, 3, 1), 0);
  EXPECT_EQ(px(image.pixels(), 5, 3, 2), 0);
}

TEST(SourceImage, GifTransparencyBecomesAlpha) {
  ft::TempDir dir;
  const auto path = dir / "clear.gif";
  write_transparent_gif(path);

  fi::SourceImage image(path);
  auto loaded = image.load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  EXPECT_TRUE(image.metadata().has_alpha);
  const auto& f = image.pixels();
  ASSERT_EQ(f.format(), fc::PixelFormat::BGRA8);
  ASSERT_EQ(f.width(), 4u);
  ASSERT_EQ(f.height(), 2u);
  for (std::uint32_t y = 0; y < 2; ++y) {
    EXPECT_EQ(px(f, 0, y, 3), 0) << "outside the image";
    EXPECT_EQ(px(f, 1, y, 0), 0);
    EXPECT_EQ(px(f, 1, y, 1), 255);
    EXPECT_EQ(px(f, 1, y, 2), 0);
    EXPECT_EQ(px(f, 1, y, 3), 255);
    EXPECT_EQ(px(f, 2, y, 3), 0) << "transparent index";
    EXPECT_EQ(px(f, 3, y, 3), 0) << "outside the image";
  }
}

TEST(SourceImage, TruncatedGifIsUnsupported) {
  ft::TempDir dir;
  const auto path = dir / "cut.gif";
  write_raw(path, {'G', 'I', 'F', '8', '9', 'a', 4, 0});
  fi::SourceImage image(path);
  auto loaded = image.load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().kind, fc::PipelineError::UnsupportedFormat);
}

TEST(SourceImage, DecodesTiff) {
  ft::TempDir dir;
  const cv::Mat gradient = ft::gradient_mat(20, 12);
  const auto path = ft::write_image(dir / "g.tiff", gradient);
  fi::SourceImage image(path);
  auto loaded = image.load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  ASSERT_EQ(image.pixels().format(), fc::PixelFormat::BGR8);
  EXPECT_EQ(image.metadata().width, 20u);
  EXPECT_EQ(image.metadata().height, 12u);
  const cv::Vec3b expected = gradient.at<cv::Vec3b>(7, 13);
  for (std::size_t c = 0; c < 3; ++c) EXPECT_EQ(px(image.pixels(), 13, 7, c), expected[c]);
}

TEST(IccProfile, JpegSegmentsReassembledBySequence) {
  const auto jpeg = jpeg_with({icc_segment("world", 2, 2), icc_segment("hello ", 1, 2)});
  std::vector<std::byte> bytes(jpeg.size());
  std::memcpy(bytes.data(), jpeg.data(), jpeg.size());
  EXPECT_EQ(fi::extract_icc_profile(bytes), to_bytes("hello world"));
}

TEST(IccProfile, PngIccpChunkIsInflated) {
  const std::string profile(300, 'p');
  std::vector<std::uint8_t> packed(compressBound(static_cast<uLong>(profile.size())));
  uLongf packed_len = static_cast<uLongf>(packed.size());
  ASSERT_EQ(compress(packed.data(), &packed_len,
                     reinterpret_cast<const Bytef*>(profile.data()),
                     static_cast<uLong>(profile.size())),
            Z_OK);
  packed.resize(packed_len);

  std::vector<std::uint8_t> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  put_chunk(png, "IHDR", std::vector<std::uint8_t>(13, 0));
  std::vector<std::uint8_t> iccp = {'s', 'R', 'G', 'B', 0, 0};
  iccp.insert(iccp.end(), packed.begin(), packed.end());
  put_chunk(png, "iCCP", iccp);
  put_chunk(png, "IEND", {});

  std::vector<std::byte> bytes(png.size());
  std::memcpy(bytes.data(), png.data(), png.size());
  EXPECT_EQ(fi::extract_icc_profile(bytes), to_bytes(profile));
}

TEST(IccProfile, OversizedPngProfileIsDropped) {
  const std::vector<std::uint8_t> zeros(5u << 20, 0);
  std::vector<std::uint8_t> packed(compressBound(static_cast<uLong>(zeros.size())));
  uLongf packed_len = static_cast<uLongf>(packed.size());
  ASSERT_EQ(compress(packed.data(), &packed_len, zeros.data(), static_cast<uLong>(zeros.size())),
            Z_OK);
  packed.resize(packed_len);

  std::vector<std::uint8_t> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  put_chunk(png, "IHDR", std::vector<std::uint8_t>(13, 0));
  std::vector<std::uint8_t> iccp = {'b', 'i', 'g', 0, 0};
  iccp.insert(iccp.end(), packed.begin(), packed.end());
  put_chunk(png, "iCCP", iccp);
  put_chunk(png, "IEND", {});

  std::vector<std::byte> bytes(png.size());
  std::memcpy(bytes.data(), png.data(), png.size());
  EXPECT_TRUE(fi::extract_icc_profile(bytes).empty());
}

TEST(ColorManagement, SrgbProfileIsStable) {
  const auto& first = fi::srgb_icc_profile();
  ASSERT_GT(first.size(), 128u);
  EXPECT_EQ(&first, &fi::srgb_icc_profile());
  fc::Frame frame = ft::solid_frame(2, 2, 10, 120, 240);
  EXPECT_TRUE(fi::convert_to_srgb(frame, first));
  EXPECT_NEAR(px(frame, 1, 1, 0), 10, 2);
  EXPECT_NEAR(px(frame, 1, 1, 1), 120, 2);
  EXPECT_NEAR(px(frame, 1, 1, 2), 240, 2);
}

TEST(IccProfile, PlainFilesHaveNone) {
  EXPECT_TRUE(fi::extract_icc_profile(to_bytes("GIF89a....")).empty());
  EXPECT_TRUE(fi::extract_icc_profile({}).empty());
}

TEST(ImageIo, SupportedExtensions) {
  EXPECT_TRUE(fi::is_supported_extension("a.PNG"));
  EXPECT_TRUE(fi::is_supported_extension("dir/b.jpeg"));
  EXPECT_TRUE(fi::is_supported_extension("c.tiff"));
  EXPECT_FALSE(fi::is_supported_extension("d.webp"));
  EXPECT_FALSE(fi::is_supported_extension("noext"));
}

TEST(ImageIo, WriteJpegPreview) {
  ft::TempDir dir;
  const auto path = dir / "preview.jpg";
  ASSERT_TRUE(fi::write_jpeg(ft::solid_frame(20, 10, 0, 128, 255), path, 90).has_value());
  const cv::Mat back = cv::imread(path.string());
  ASSERT_FALSE(back.empty());
  EXPECT_EQ(back.cols, 20);
  EXPECT_EQ(back.rows, 10);
}

TEST(ImageIo, WriteJpegToMissingDirectoryFails) {
  ft::TempDir dir;
  auto written = fi::write_jpeg(ft::solid_frame(4, 4, 0, 0, 0), dir / "no" / "such" / "p.jpg", 90);
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error().kind, fc::PipelineError::Encoding);
}
