#include <fadegif/gif/gif_writer.hpp>
#include <gif_lib.h>
#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <system_error>
#include <variant>

namespace fadegif::gif {

namespace fc = fadegif::core;

namespace {

constexpr char kNetscapeId[] = "NETSCAPE2.0";
constexpr char kIccId[] = "ICCRGBG1012";
constexpr std::size_t kAppIdLen = 11;
constexpr std::size_t kMaxSubBlock = 255;

struct ColorMapDeleter {
  void operator()(ColorMapObject* map) const noexcept { GifFreeMapObject(map); }
};
using ColorMapPtr = std::unique_ptr<ColorMapObject, ColorMapDeleter>;

/// Color table padded to the power-of-two size GIF requires.
ColorMapPtr make_color_map(const fc::Palette& palette) {
  const int bits = GifBitSize(static_cast<int>(std::max<std::size_t>(palette.size(), 2)));
  ColorMapPtr map(GifMakeMapObject(1 << bits, nullptr));
  if (!map) return map;
  for (std::size_t i = 0; i < palette.size(); ++i) {
    map->Colors[i].Red = palette.colors[i].r;
    map->Colors[i].Green = palette.colors[i].g;
    map->Colors[i].Blue = palette.colors[i].b;
  }
  return map;
}

/// Drop palette entries no pixel refers to; indices are remapped in place.
/// Surviving entries keep their relative order.
fc::Palette compact_palette(const fc::Palette& palette, std::vector<GifPixelType>& pixels) {
  std::array<bool, fc::kMaxPaletteSize> used{};
  for (auto p : pixels) used[p] = true;

  std::array<GifPixelType, fc::kMaxPaletteSize> remap{};
  fc::Palette compact;
  for (std::size_t i = 0; i < palette.size(); ++i) {
    if (!used[i]) continue;
    remap[i] = static_cast<GifPixelType>(compact.colors.size());
    compact.colors.push_back(palette.colors[i]);
  }
  for (auto& p : pixels) p = remap[p];
  return compact;
}

std::string gif_error_text(int code) {
  const char* text = GifErrorString(code);
  return text ? text : "giflib error " + std::to_string(code);
}

}  // namespace

std::uint16_t DelayAccumulator::next_delay_cs(std::uint32_t duration_ms) noexcept {
  elapsed_ms_ += duration_ms;
  const std::uint64_t target_cs = (elapsed_ms_ + 5) / 10;
  std::uint64_t delay = target_cs > emitted_cs_ ? target_cs - emitted_cs_ : 0;
  delay = std::clamp<std::uint64_t>(delay, 1, 0xFFFF);
  emitted_cs_ += delay;
  return static_cast<std::uint16_t>(delay);
}

std::uint16_t DelayAccumulator::hold_delay_cs(std::uint32_t duration_ms) noexcept {
  elapsed_ms_ = 0;
  emitted_cs_ = 0;
  const std::uint64_t delay = (static_cast<std::uint64_t>(duration_ms) + 5) / 10;
  return static_cast<std::uint16_t>(std::clamp<std::uint64_t>(delay, 1, 0xFFFF));
}

GifWriter::~GifWriter() { abort(); }

fc::Error GifWriter::fail(const char* what, int gif_error) {
  fc::Error err{fc::PipelineError::Encoding,
                std::string(what) + " " + output_.string() + ": " + gif_error_text(gif_error)};
  abort();
  return err;
}

std::expected<void, fc::Error> GifWriter::open(const std::filesystem::path& output,
                                               std::uint32_t width,
                                               std::uint32_t height,
                                               GifStreamOptions options) {
  if (gif_) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding, "writer already open"});
  }
  if (width == 0 || height == 0 || width > 0xFFFF || height > 0xFFFF) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "canvas size not representable in GIF"});
  }

  output_ = output;
  partial_ = output;
  partial_ += ".part";
  width_ = width;
  height_ = height;
  optimize_ = options.optimize;
  frame_count_ = 0;
  delays_ = DelayAccumulator{};

  int error = 0;
  gif_ = EGifOpenFileName(partial_.string().c_str(), false, &error);
  if (!gif_) {
    return std::unexpected(fc::Error{
        fc::PipelineError::Encoding,
        "cannot create " + output_.string() + ": " + gif_error_text(error)});
  }
  EGifSetGifVersion(gif_, true);

  ColorMapPtr global;
  if (options.global_palette && !options.global_palette->empty()) {
    global = make_color_map(*options.global_palette);
    if (!global) return std::unexpected(fail("out of memory writing", E_GIF_ERR_NOT_ENOUGH_MEM));
  }
  global_palette_.reset();
  if (global) global_palette_ = std::move(options.global_palette);

  if (EGifPutScreenDesc(gif_, static_cast<int>(width), static_cast<int>(height), 8, 0,
                        global.get()) != GIF_OK) {
    return std::unexpected(fail("cannot write header of", gif_->Error));
  }

  const std::array<GifByteType, 3> loop = {
      1, static_cast<GifByteType>(options.loop_count & 0xFF),
      static_cast<GifByteType>(options.loop_count >> 8)};
  if (EGifPutExtensionLeader(gif_, APPLICATION_EXT_FUNC_CODE) != GIF_OK ||
      EGifPutExtensionBlock(gif_, static_cast<int>(kAppIdLen), kNetscapeId) != GIF_OK ||
      EGifPutExtensionBlock(gif_, static_cast<int>(loop.size()), loop.data()) != GIF_OK ||
      EGifPutExtensionTrailer(gif_) != GIF_OK) {
    return std::unexpected(fail("cannot write loop extension to", gif_->Error));
  }

  if (!options.icc_profile.empty()) {
    if (EGifPutExtensionLeader(gif_, APPLICATION_EXT_FUNC_CODE) != GIF_OK ||
        EGifPutExtensionBlock(gif_, static_cast<int>(kAppIdLen), kIccId) != GIF_OK) {
      return std::unexpected(fail("cannot write color profile to", gif_->Error));
    }
    const auto& icc = options.icc_profile;
    for (std::size_t pos = 0; pos < icc.size(); pos += kMaxSubBlock) {
      const std::size_t len = std::min(kMaxSubBlock, icc.size() - pos);
      if (EGifPutExtensionBlock(gif_, static_cast<int>(len), icc.data() + pos) != GIF_OK) {
        return std::unexpected(fail("cannot write color profile to", gif_->Error));
      }
    }
    if (EGifPutExtensionTrailer(gif_) != GIF_OK) {
      return std::unexpected(fail("cannot write color profile to", gif_->Error));
    }
  }
  return {};
}

std::expected<void, fc::Error> GifWriter::write(const fc::IndexedFrame& frame) {
  if (!gif_) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding, "writer is not open"});
  }
  if (frame.width != width_ || frame.height != height_) {
    return std::unexpected(fc::Error{
        fc::PipelineError::DimensionMismatch,
        "frame " + std::to_string(frame.width) + "x" + std::to_string(frame.height) +
            " does not match canvas " + std::to_string(width_) + "x" + std::to_string(height_)});
  }
  const std::size_t pixel_count = static_cast<std::size_t>(width_) * height_;
  if (frame.indices.size() != pixel_count || frame.palette.empty() ||
      frame.palette.size() > fc::kMaxPaletteSize) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding, "malformed indexed frame"});
  }
  const bool out_of_range = std::any_of(frame.indices.begin(), frame.indices.end(),
                                        [&](std::uint8_t i) { return i >= frame.palette.size(); });
  if (out_of_range) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "palette index out of range"});
  }

  const bool on_global = frame.uses_global_palette && global_palette_.has_value();
  if (on_global && frame.palette != *global_palette_) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "frame " + std::to_string(frame_count_) +
                                         " palette differs from the global color table"});
  }

  std::vector<GifPixelType> pixels(frame.indices.begin(), frame.indices.end());
  ColorMapPtr local;
  if (!on_global) {
    const fc::Palette table = optimize_ ? compact_palette(frame.palette, pixels) : frame.palette;
    local = make_color_map(table);
    if (!local) return std::unexpected(fail("out of memory writing", E_GIF_ERR_NOT_ENOUGH_MEM));
  }

  GraphicsControlBlock gcb{};
  gcb.DisposalMode = DISPOSE_BACKGROUND;
  gcb.UserInputFlag = false;
  gcb.DelayTime = frame.is_hold ? delays_.hold_delay_cs(frame.duration_ms)
                                : delays_.next_delay_cs(frame.duration_ms);
  gcb.TransparentColor = NO_TRANSPARENT_COLOR;
  std::array<GifByteType, 4> extension{};
  const std::size_t ext_len = EGifGCBToExtension(&gcb, extension.data());
  if (EGifPutExtension(gif_, GRAPHICS_EXT_FUNC_CODE, static_cast<int>(ext_len),
                       extension.data()) != GIF_OK) {
    return std::unexpected(fail("cannot write frame timing to", gif_->Error));
  }

  if (EGifPutImageDesc(gif_, 0, 0, static_cast<int>(width_), static_cast<int>(height_), false,
                       local.get()) != GIF_OK) {
    return std::unexpected(fail("cannot write frame to", gif_->Error));
  }
  for (std::uint32_t y = 0; y < height_; ++y) {
    GifPixelType* row = pixels.data() + static_cast<std::size_t>(y) * width_;
    if (EGifPutLine(gif_, row, static_cast<int>(width_)) != GIF_OK) {
      return std::unexpected(fail("cannot write frame to", gif_->Error));
    }
  }

  ++frame_count_;
  return {};
}

fc::PipelineResult GifWriter::finish() {
  if (!gif_) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding, "writer is not open"});
  }
  if (frame_count_ == 0) {
    abort();
    return std::unexpected(fc::Error{fc::PipelineError::EmptyInput, "no frames to encode"});
  }

  int error = 0;
  const int rc = EGifCloseFile(gif_, &error);
  gif_ = nullptr;  // released by giflib even on failure
  std::error_code ec;
  if (rc != GIF_OK) {
    std::filesystem::remove(partial_, ec);
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "cannot finish " + output_.string() + ": " +
                                         gif_error_text(error)});
  }

  std::filesystem::rename(partial_, output_, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(partial_, ignored);
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "cannot move " + partial_.string() + " to " +
                                         output_.string() + ": " + ec.message()});
  }

  auto resolved = std::filesystem::weakly_canonical(output_, ec);
  return fc::PipelineSuccess{ec ? output_ : resolved, frame_count_};
}

void GifWriter::abort() noexcept {
  if (!gif_) return;
  int error = 0;
  EGifCloseFile(gif_, &error);
  gif_ = nullptr;
  std::error_code ec;
  std::filesystem::remove(partial_, ec);
}

fc::PipelineResult encode(std::span<const fc::IndexedFrame> frames,
                          const fc::PipelineConfig& config,
                          const std::filesystem::path& output) {
  if (frames.empty()) {
    return std::unexpected(fc::Error{fc::PipelineError::EmptyInput, "no frames to encode"});
  }

  GifStreamOptions options;
  options.optimize = config.optimize;
  if (std::holds_alternative<fc::GlobalPalette>(config.palette_mode) &&
      frames.front().uses_global_palette) {
    options.global_palette = frames.front().palette;
  }

  GifWriter writer;
  if (auto opened = writer.open(output, frames.front().width, frames.front().height,
                                std::move(options));
      !opened) {
    return std::unexpected(std::move(opened.error()));
  }
  for (const auto& frame : frames) {
    if (auto written = writer.write(frame); !written) {
      return std::unexpected(std::move(written.error()));
    }
  }
  return writer.finish();
}

}  // namespace fadegif::gif
