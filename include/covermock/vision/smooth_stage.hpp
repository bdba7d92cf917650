#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <covermock/core/pipeline_stage.hpp>
#include <covermock/vision/resize.hpp>
#include <expected>

namespace covermock::vision {

/// Softens splat edges: resample to twice the size, then back to the original size,
/// both with the same filter. Frames with alpha are resampled premultiplied.
/// Output has the input's dimensions and format.
class SmoothStage : public covermock::core::IPipelineStage {
 public:
  explicit SmoothStage(Interpolation interpolation = Interpolation::Lanczos);

  [[nodiscard]] std::expected<covermock::core::Frame,
                              covermock::core::PipelineError>
  process(const covermock::core::Frame& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "smooth"; }

 private:
  Interpolation interpolation_;
};

}  // namespace covermock::vision
