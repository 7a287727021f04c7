#pragma once

#include <fadegif/core/error.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>

namespace fadegif::core {

/// Successful run: where the GIF was written and how many frames it holds.
struct PipelineSuccess {
  std::filesystem::path output_path;
  std::size_t frame_count{0};
};

/// Terminal value of a run or an encode.
using PipelineResult = std::expected<PipelineSuccess, Error>;

}  // namespace fadegif::core
