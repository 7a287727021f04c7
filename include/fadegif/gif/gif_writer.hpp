#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/indexed_frame.hpp>
#include <fadegif/core/palette.hpp>
#include <fadegif/core/pipeline_config.hpp>
#include <fadegif/core/pipeline_result.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

struct GifFileType;

namespace fadegif::gif {

/// Converts millisecond durations to GIF centisecond delays.
///
/// Fade frames share one rounding run: each delay is the rounded (half up)
/// elapsed time of the run minus what the run already emitted, never less
/// than 1 cs, so a run of very short frames overruns instead of drifting.
/// A hold frame gets exactly round(duration / 10) cs and starts a new run.
class DelayAccumulator {
 public:
  [[nodiscard]] std::uint16_t next_delay_cs(std::uint32_t duration_ms) noexcept;
  [[nodiscard]] std::uint16_t hold_delay_cs(std::uint32_t duration_ms) noexcept;

 private:
  std::uint64_t elapsed_ms_{0};
  std::uint64_t emitted_cs_{0};
};

struct GifStreamOptions {
  /// Written as the global color table; frames flagged uses_global_palette skip their local table.
  std::optional<fadegif::core::Palette> global_palette;
  /// Raw ICC profile, stored in an ICCRGBG1 application extension when non-empty.
  std::vector<std::byte> icc_profile;
  /// Drop unused entries from local color tables.
  bool optimize{true};
  /// NETSCAPE2.0 loop count; 0 loops forever.
  std::uint16_t loop_count{0};
};

/// Streaming GIF89a writer on top of giflib. Frames are written as they
/// arrive, each full-canvas with restore-to-background disposal.
///
/// Output goes to "<path>.part" and is renamed on finish(); an unfinished
/// writer (error, abort or destruction) closes the file and removes it.
class GifWriter {
 public:
  GifWriter() = default;
  ~GifWriter();

  GifWriter(const GifWriter&) = delete;
  GifWriter& operator=(const GifWriter&) = delete;

  [[nodiscard]] std::expected<void, fadegif::core::Error> open(
      const std::filesystem::path& output,
      std::uint32_t width,
      std::uint32_t height,
      GifStreamOptions options = {});

  /// Append one frame. Encoding error on write failure (the writer is then aborted).
  /// A frame flagged uses_global_palette must carry the table given to open().
  [[nodiscard]] std::expected<void, fadegif::core::Error> write(
      const fadegif::core::IndexedFrame& frame);

  /// Close and publish the file. EmptyInput if no frame was written.
  [[nodiscard]] fadegif::core::PipelineResult finish();

  /// Close and delete the partial file; no-op when not open.
  void abort() noexcept;

  [[nodiscard]] bool is_open() const noexcept { return gif_ != nullptr; }
  [[nodiscard]] std::size_t frame_count() const noexcept { return frame_count_; }

 private:
  fadegif::core::Error fail(const char* what, int gif_error);

  GifFileType* gif_{nullptr};
  std::filesystem::path output_;
  std::filesystem::path partial_;
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  std::optional<fadegif::core::Palette> global_palette_;
  bool optimize_{true};
  std::size_t frame_count_{0};
  DelayAccumulator delays_;
};

/// One-shot encode of an ordered frame sequence. EmptyInput when frames is empty.
/// With a GlobalPalette mode the first frame's palette becomes the global table
/// and every other frame flagged uses_global_palette must carry the same one.
[[nodiscard]] fadegif::core::PipelineResult encode(
    std::span<const fadegif::core::IndexedFrame> frames,
    const fadegif::core::PipelineConfig& config,
    const std::filesystem::path& output);

}  // namespace fadegif::gif
