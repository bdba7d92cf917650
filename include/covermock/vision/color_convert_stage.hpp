#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <covermock/core/pipeline_stage.hpp>
#include <expected>

namespace covermock::vision {

/// Converts \p input to \p output_format (e.g. BGR8 -> RGBA8, RGBA8 -> Grayscale8).
/// Added alpha channels are opaque. InvalidImage for invalid frames or unsupported pairs.
[[nodiscard]] std::expected<covermock::core::Frame, covermock::core::PipelineError>
convert_frame(const covermock::core::Frame& input,
              covermock::core::PixelFormat output_format);

/// Alpha-composites an RGBA8/BGRA8 frame onto opaque white; other formats are returned as a copy.
[[nodiscard]] std::expected<covermock::core::Frame, covermock::core::PipelineError>
flatten_onto_white(const covermock::core::Frame& input);

/// Pipeline stage wrapping convert_frame.
class ColorConvertStage : public covermock::core::IPipelineStage {
 public:
  explicit ColorConvertStage(covermock::core::PixelFormat output_format);

  [[nodiscard]] std::expected<covermock::core::Frame,
                              covermock::core::PipelineError>
  process(const covermock::core::Frame& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "color_convert"; }

 private:
  covermock::core::PixelFormat output_format_;
};

}  // namespace covermock::vision
