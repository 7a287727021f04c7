#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace fadegif::imaging {

/// Extract the embedded ICC profile from an encoded JPEG (APP2 ICC_PROFILE
/// segments, reassembled by sequence number) or PNG (iCCP chunk, inflated).
/// Returns an empty vector when the file carries no profile or it is malformed
/// (an iCCP profile inflating past 4 MiB counts as malformed).
[[nodiscard]] std::vector<std::byte> extract_icc_profile(
    std::span<const std::byte> encoded);

}  // namespace fadegif::imaging
