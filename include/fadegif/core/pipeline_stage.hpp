#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/frame.hpp>
#include <expected>

namespace fadegif::core {

/// Abstract frame stage: process one Frame, return the transformed Frame or an error.
class IFrameStage {
 public:
  virtual ~IFrameStage() = default;

  [[nodiscard]] virtual std::expected<Frame, Error> process(
      const Frame& input) = 0;
};

}  // namespace fadegif::core
