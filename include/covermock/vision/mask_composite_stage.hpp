#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <covermock/core/pipeline_stage.hpp>
#include <expected>

namespace covermock::vision {

/// Blends \p layer over \p base through \p mask. All three must share dimensions;
/// base and layer are RGBA8, mask is Grayscale8.
/// Per pixel the layer weight is mask * layer_alpha / 255^2: a zero mask keeps the base,
/// a full mask over an opaque layer pixel gives the layer, a transparent layer pixel keeps the base.
[[nodiscard]] std::expected<covermock::core::Frame, covermock::core::PipelineError>
composite_through_mask(const covermock::core::Frame& base,
                       const covermock::core::Frame& layer,
                       const covermock::core::Frame& mask);

/// Final pipeline stage: composites the warped cover onto the book template.
/// The mask is normalized once at construction: reduced to grayscale and resampled
/// (Lanczos) to the template's size when they differ. The template is coerced to RGBA8.
class MaskCompositeStage : public covermock::core::IPipelineStage {
 public:
  /// Use is_ready() to check that the template and mask could be normalized.
  MaskCompositeStage(const covermock::core::Frame& book_template,
                     const covermock::core::Frame& mask);

  [[nodiscard]] bool is_ready() const noexcept { return !template_rgba_.empty() && !mask_.empty(); }

  [[nodiscard]] std::uint32_t canvas_width() const noexcept { return template_rgba_.width(); }
  [[nodiscard]] std::uint32_t canvas_height() const noexcept { return template_rgba_.height(); }

  /// Input: the smoothed, warped cover (any 1/3/4-channel format, template size).
  /// CompositingFailure when not ready or when sizes differ.
  [[nodiscard]] std::expected<covermock::core::Frame,
                              covermock::core::PipelineError>
  process(const covermock::core::Frame& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "mask_composite"; }

 private:
  covermock::core::Frame template_rgba_;
  covermock::core::Frame mask_;
};

}  // namespace covermock::vision
