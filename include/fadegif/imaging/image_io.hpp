#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

namespace fadegif::imaging {

/// True for .png, .jpg, .jpeg, .bmp, .gif, .tif and .tiff (case-insensitive).
[[nodiscard]] bool is_supported_extension(const std::filesystem::path& path);

/// Read a whole file into memory. UnsupportedFormat when it cannot be opened.
[[nodiscard]] std::expected<std::vector<std::byte>, fadegif::core::Error>
read_file_bytes(const std::filesystem::path& path);

/// Re-encode a frame as JPEG at the given quality (0-100). Encoding error on failure.
[[nodiscard]] std::expected<void, fadegif::core::Error> write_jpeg(
    const fadegif::core::Frame& frame,
    const std::filesystem::path& path,
    std::uint32_t quality);

}  // namespace fadegif::imaging
