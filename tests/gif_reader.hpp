#pragma once

#include <fadegif/core/palette.hpp>
#include <gif_lib.h>
#include <gtest/gtest.h>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fadegif::testing {

struct DecodedFrame {
  std::uint16_t delay_cs{0};
  int disposal{DISPOSAL_UNSPECIFIED};
  int left{0};
  int top{0};
  int width{0};
  int height{0};
  int local_map_size{0};  // 0 when the frame uses the global table
  std::vector<core::Rgb> pixels;  // resolved through the active color table
};

struct DecodedGif {
  int width{0};
  int height{0};
  int global_map_size{0};
  std::optional<std::uint16_t> loop_count;
  std::vector<std::uint8_t> icc_profile;
  std::vector<DecodedFrame> frames;
};

namespace detail {

inline void scan_extensions(const ExtensionBlock* blocks, int count, DecodedGif& out) {
  for (int i = 0; i < count; ++i) {
    const auto& b = blocks[i];
    if (b.Function != APPLICATION_EXT_FUNC_CODE || b.ByteCount != 11) continue;
    std::vector<std::uint8_t> data;
    for (int j = i + 1; j < count && blocks[j].Function == CONTINUE_EXT_FUNC_CODE; ++j) {
      data.insert(data.end(), blocks[j].Bytes, blocks[j].Bytes + blocks[j].ByteCount);
    }
    if (std::memcmp(b.Bytes, "NETSCAPE2.0", 11) == 0 && data.size() >= 3) {
      out.loop_count = static_cast<std::uint16_t>(data[1] | (data[2] << 8));
    } else if (std::memcmp(b.Bytes, "ICCRGBG1012", 11) == 0) {
      out.icc_profile = std::move(data);
    }
  }
}

}  // namespace detail

/// Decode a whole GIF with giflib; fails the current test on decode errors.
inline DecodedGif read_gif(const std::filesystem::path& path) {
  DecodedGif out;
  int error = 0;
  GifFileType* gif = DGifOpenFileName(path.string().c_str(), &error);
  if (!gif) {
    ADD_FAILURE() << "cannot open " << path << ": " << error;
    return out;
  }
  if (DGifSlurp(gif) != GIF_OK) {
    ADD_FAILURE() << "cannot decode " << path << ": " << gif->Error;
    DGifCloseFile(gif, &error);
    return out;
  }

  out.width = gif->SWidth;
  out.height = gif->SHeight;
  out.global_map_size = gif->SColorMap ? gif->SColorMap->ColorCount : 0;
  detail::scan_extensions(gif->ExtensionBlocks, gif->ExtensionBlockCount, out);

  for (int i = 0; i < gif->ImageCount; ++i) {
    const SavedImage& image = gif->SavedImages[i];
    detail::scan_extensions(image.ExtensionBlocks, image.ExtensionBlockCount, out);

    DecodedFrame frame;
    GraphicsControlBlock gcb{};
    if (DGifSavedExtensionToGCB(gif, i, &gcb) == GIF_OK) {
      frame.delay_cs = static_cast<std::uint16_t>(gcb.DelayTime);
      frame.disposal = gcb.DisposalMode;
    }
    frame.left = image.ImageDesc.Left;
    frame.top = image.ImageDesc.Top;
    frame.width = image.ImageDesc.Width;
    frame.height = image.ImageDesc.Height;
    const ColorMapObject* map = image.ImageDesc.ColorMap ? image.ImageDesc.ColorMap : gif->SColorMap;
    frame.local_map_size = image.ImageDesc.ColorMap ? image.ImageDesc.ColorMap->ColorCount : 0;
    const std::size_t n = static_cast<std::size_t>(frame.width) * frame.height;
    frame.pixels.reserve(n);
    for (std::size_t p = 0; p < n && map; ++p) {
      const GifColorType& c = map->Colors[image.RasterBits[p]];
      frame.pixels.push_back({c.Red, c.Green, c.Blue});
    }
    out.frames.push_back(std::move(frame));
  }
  DGifCloseFile(gif, &error);
  return out;
}

}  // namespace fadegif::testing
