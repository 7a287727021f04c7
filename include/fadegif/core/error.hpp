#pragma once

#include <string>
#include <string_view>

namespace fadegif::core {

/// Pipeline error kinds; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidCrop,        // crop rectangle outside source bounds or empty
  UnsupportedFormat,  // unreadable or unsupported source image
  DimensionMismatch,  // frames of one run disagree on size (internal invariant)
  EmptyInput,         // no images / no frames
  Encoding,           // output write failure
  Cancelled,          // user-initiated abort, not a failure
  InvalidConfig,
};

/// Classified error plus a human-readable message.
struct Error {
  PipelineError kind{PipelineError::None};
  std::string message;
};

[[nodiscard]] std::string_view to_string(PipelineError kind) noexcept;

}  // namespace fadegif::core
