#pragma once

#include <fadegif/core/frame.hpp>
#include <cstddef>
#include <span>
#include <vector>

namespace fadegif::imaging {

/// Convert decoded pixels described by an embedded ICC profile to sRGB, in
/// place. Grayscale8 pixels under a gray profile come back as BGR8.
/// Returns false, leaving the pixels untouched, when the profile cannot be
/// parsed or does not describe the pixel layout.
[[nodiscard]] bool convert_to_srgb(fadegif::core::Frame& pixels,
                                   std::span<const std::byte> icc_profile);

/// Serialized sRGB profile (creation date cleared, so the bytes never change).
[[nodiscard]] const std::vector<std::byte>& srgb_icc_profile();

}  // namespace fadegif::imaging
