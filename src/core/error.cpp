#include <fadegif/core/error.hpp>

namespace fadegif::core {

std::string_view to_string(PipelineError kind) noexcept {
  switch (kind) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidCrop:
      return "InvalidCrop";
    case PipelineError::UnsupportedFormat:
      return "UnsupportedFormat";
    case PipelineError::DimensionMismatch:
      return "DimensionMismatch";
    case PipelineError::EmptyInput:
      return "EmptyInput";
    case PipelineError::Encoding:
      return "Encoding";
    case PipelineError::Cancelled:
      return "Cancelled";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    default:
      return "Unknown";
  }
}

}  // namespace fadegif::core
