#pragma once

#include <covermock/core/color.hpp>
#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <cstdint>
#include <expected>

namespace covermock::vision {

/// Tuning for dominant-color sampling.
struct SamplerOptions {
  /// Cover is downsampled to grid x grid before counting.
  std::uint32_t grid{50};
  /// Pixels with r + g + b at or above this are treated as background and skipped.
  std::uint32_t brightness_threshold{700};
};

/// Most frequent RGB value of the downsampled cover, ignoring near-white pixels.
/// When every pixel is near-white, the unfiltered pixels are counted instead.
/// Ties go to the color seen first in row-major order. Alpha is ignored.
/// InvalidImage for an empty, zero-dimension or unsupported frame.
[[nodiscard]] std::expected<covermock::core::Rgb, covermock::core::PipelineError>
sample_dominant_color(const covermock::core::Frame& cover,
                      const SamplerOptions& options = {});

}  // namespace covermock::vision
