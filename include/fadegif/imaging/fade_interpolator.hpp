#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <vector>

namespace fadegif::imaging {

/// Receives fade frames in order; returning an error stops the walk.
using FadeFrameSink = std::function<std::expected<void, fadegif::core::Error>(fadegif::core::Frame)>;

/// Duration of fade frame i when fade_duration_ms is split across steps frames.
/// The durations of all steps frames sum exactly to fade_duration_ms.
[[nodiscard]] std::uint32_t fade_frame_duration(std::uint32_t index,
                                                std::uint32_t steps,
                                                std::uint32_t fade_duration_ms) noexcept;

/// Streams the interior blend frames between a and b to sink. Frame i is
/// a*(1-t) + b*t with t = (i+1)/(steps+1); a and b themselves are never emitted.
/// DimensionMismatch if a and b differ in size or format; InvalidConfig if steps == 0.
/// Pure: safe to call concurrently for independent pairs.
[[nodiscard]] std::expected<void, fadegif::core::Error> for_each_fade_frame(
    const fadegif::core::Frame& a,
    const fadegif::core::Frame& b,
    std::uint32_t steps,
    std::uint32_t fade_duration_ms,
    const FadeFrameSink& sink);

/// Collects the fade frames between a and b (exactly steps frames).
[[nodiscard]] std::expected<std::vector<fadegif::core::Frame>, fadegif::core::Error>
interpolate(const fadegif::core::Frame& a,
            const fadegif::core::Frame& b,
            std::uint32_t steps,
            std::uint32_t fade_duration_ms);

}  // namespace fadegif::imaging
