#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <expected>
#include <string_view>

namespace covermock::core {

/// Abstract pipeline stage: consume one Frame, produce the next Frame.
/// Stages are not modified by process(); one instance may serve concurrent runs.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<Frame, PipelineError> process(
      const Frame& input) const = 0;

  /// Short label used in timing output.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace covermock::core
